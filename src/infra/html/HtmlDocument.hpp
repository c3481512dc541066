#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QByteArray>

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

namespace gw::agent::infra::html {

// Named <input> values of one <form>. First occurrence of a name wins.
struct HtmlForm {
    std::string name;
    std::string action;
    std::map<std::string, std::string> inputs;

    std::optional<std::string> input(const std::string& inputName) const {
        const auto it = inputs.find(inputName);
        if (it == inputs.end()) return std::nullopt;
        return it->second;
    }
};

// Owning wrapper over a libxml2 HTML tree.
//
// libxml2's HTML parser is lenient (recover mode, no network, no diagnostics),
// so any byte sequence yields a document; an empty input yields an invalid one.
// The input is decoded with resolveEncoding(); all returned text is UTF-8.
class HtmlDocument final {
public:
    // `contentType` is the HTTP Content-Type the page was served with, if any.
    static HtmlDocument parse(const QByteArray& html, const QByteArray& contentType = QByteArray());

    bool isValid() const noexcept { return doc_ != nullptr; }

    // Text of the first <title> element, untrimmed. Empty if there is none.
    std::string title() const;

    // First <form> with matching name and action attributes.
    std::optional<HtmlForm> findForm(const std::string& name, const std::string& action) const;

    // href attribute of every <a> element, in document order.
    std::vector<std::string> anchorHrefs() const;

    // Visits every element with the given (case-insensitive) tag name in document order.
    void forEachElement(const char* tagName, const std::function<void(xmlNode*)>& fn) const;

    // --- Node helpers ---

    static std::string attribute(const xmlNode* node, const char* name);
    static bool isElement(const xmlNode* node, const char* tagName);

    // Whitespace-separated class list contains `cls`.
    static bool hasClass(const xmlNode* node, const std::string& cls);

    // Closest ancestor element with the given tag name, or nullptr.
    static xmlNode* nearestAncestor(const xmlNode* node, const char* tagName);

    // Direct element children with the given tag name (nested ones are not included).
    static std::vector<xmlNode*> childElements(const xmlNode* node, const char* tagName);

    // Concatenated descendant text; nullopt if libxml2 could not produce it.
    static std::optional<std::string> textContent(const xmlNode* node);

private:
    struct DocDeleter {
        void operator()(xmlDoc* d) const noexcept { xmlFreeDoc(d); }
    };

    explicit HtmlDocument(xmlDoc* doc)
        : doc_(doc) {
    }

    xmlNode* root() const;

    std::unique_ptr<xmlDoc, DocDeleter> doc_;
};

// Encoding used to decode `html`, in order of precedence: the charset parameter
// of `contentType`, a <meta> charset declaration, UTF-8 when the bytes are valid
// UTF-8, otherwise ISO-8859-1. A declared charset libxml2 cannot convert is
// replaced by the undeclared fallback.
std::string resolveEncoding(const QByteArray& html, const QByteArray& contentType);

// Trims ASCII whitespace and U+00A0 from both ends.
std::string trimText(const std::string& s);

// Replaces every U+00A0 (UTF-8 C2 A0) with a regular space.
std::string collapseNbsp(const std::string& s);

} // namespace gw::agent::infra::html
