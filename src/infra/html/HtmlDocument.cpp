#include "infra/html/HtmlDocument.hpp"

#include <cctype>
#include <sstream>

#include <QDebug>
#include <QRegularExpression>
#include <QStringDecoder>

#include <libxml/encoding.h>
#include <libxml/parser.h>

namespace gw::agent::infra::html {

namespace {

constexpr int kParseOptions =
    HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET;

constexpr int kMetaScanBytes = 4096;
constexpr auto kUndeclaredFallback = "ISO-8859-1";

QByteArray unquote(QByteArray v) {
    v = v.trimmed();
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        v = v.mid(1, v.size() - 2).trimmed();
    }
    return v;
}

QByteArray charsetParameter(const QByteArray& contentType) {
    const QList<QByteArray> params = contentType.split(';');
    for (qsizetype i = 1; i < params.size(); ++i) {
        const QByteArray p = params[i].trimmed();
        const qsizetype eq = p.indexOf('=');
        if (eq > 0 && p.left(eq).trimmed().toLower() == "charset") {
            return unquote(p.mid(eq + 1));
        }
    }
    return QByteArray();
}

// <meta charset="x"> or <meta http-equiv="Content-Type" content="text/html; charset=x">.
QByteArray metaCharset(const QByteArray& html) {
    static const QRegularExpression re(
        QStringLiteral(R"(<meta\b[^>]*?charset\s*=\s*["']?\s*([A-Za-z0-9_.:\-]+))"),
        QRegularExpression::CaseInsensitiveOption);
    const auto m = re.match(QString::fromLatin1(html.left(kMetaScanBytes)));
    return m.hasMatch() ? m.captured(1).toLatin1() : QByteArray();
}

bool isValidUtf8(const QByteArray& bytes) {
    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString decoded = decoder.decode(bytes);
    Q_UNUSED(decoded);
    return !decoder.hasError();
}

std::string fallbackEncoding(const QByteArray& html) {
    return isValidUtf8(html) ? "UTF-8" : kUndeclaredFallback;
}

bool hasConverter(const QByteArray& encoding) {
    xmlCharEncodingHandlerPtr handler = xmlFindCharEncodingHandler(encoding.constData());
    if (!handler) {
        return false;
    }
    xmlCharEncCloseFunc(handler);
    return true;
}

void visit(xmlNode* node, const char* tagName, const std::function<void(xmlNode*)>& fn) {
    for (xmlNode* cur = node; cur; cur = cur->next) {
        if (HtmlDocument::isElement(cur, tagName)) {
            fn(cur);
        }
        if (cur->children) {
            visit(cur->children, tagName, fn);
        }
    }
}

} // namespace

std::string resolveEncoding(const QByteArray& html, const QByteArray& contentType) {
    QByteArray declared = charsetParameter(contentType);
    if (declared.isEmpty()) {
        declared = metaCharset(html);
    }
    if (declared.isEmpty()) {
        return fallbackEncoding(html);
    }
    if (!hasConverter(declared)) {
        const std::string fallback = fallbackEncoding(html);
        qWarning() << "Unsupported page charset" << declared << "- decoding as"
                   << QString::fromStdString(fallback);
        return fallback;
    }
    return declared.toStdString();
}

HtmlDocument HtmlDocument::parse(const QByteArray& html, const QByteArray& contentType) {
    if (html.isEmpty()) {
        return HtmlDocument(nullptr);
    }

    xmlInitParser();
    const std::string encoding = resolveEncoding(html, contentType);
    htmlDocPtr doc = htmlReadMemory(html.constData(), static_cast<int>(html.size()), nullptr,
                                    encoding.c_str(), kParseOptions);
    return HtmlDocument(doc);
}

xmlNode* HtmlDocument::root() const {
    if (!doc_) return nullptr;
    return xmlDocGetRootElement(doc_.get());
}

void HtmlDocument::forEachElement(const char* tagName, const std::function<void(xmlNode*)>& fn) const {
    xmlNode* r = root();
    if (!r) return;
    visit(r, tagName, fn);
}

std::string HtmlDocument::title() const {
    std::optional<std::string> out;
    forEachElement("title", [&](xmlNode* node) {
        if (!out) {
            out = textContent(node).value_or(std::string());
        }
    });
    return out.value_or(std::string());
}

std::optional<HtmlForm> HtmlDocument::findForm(const std::string& name, const std::string& action) const {
    std::optional<HtmlForm> found;
    forEachElement("form", [&](xmlNode* formNode) {
        if (found) return;
        if (attribute(formNode, "name") != name || attribute(formNode, "action") != action) {
            return;
        }

        HtmlForm form;
        form.name = name;
        form.action = action;
        if (formNode->children) {
            visit(formNode->children, "input", [&](xmlNode* input) {
                const std::string inputName = attribute(input, "name");
                if (inputName.empty()) return;
                form.inputs.emplace(inputName, attribute(input, "value"));
            });
        }
        found = std::move(form);
    });
    return found;
}

std::vector<std::string> HtmlDocument::anchorHrefs() const {
    std::vector<std::string> out;
    forEachElement("a", [&](xmlNode* a) {
        std::string href = attribute(a, "href");
        if (!href.empty()) {
            out.push_back(std::move(href));
        }
    });
    return out;
}

std::string HtmlDocument::attribute(const xmlNode* node, const char* name) {
    if (!node) return {};
    xmlChar* v = xmlGetProp(node, BAD_CAST name);
    if (!v) return {};
    std::string s = reinterpret_cast<const char*>(v);
    xmlFree(v);
    return s;
}

bool HtmlDocument::isElement(const xmlNode* node, const char* tagName) {
    return node && node->type == XML_ELEMENT_NODE && node->name &&
           xmlStrcasecmp(node->name, BAD_CAST tagName) == 0;
}

bool HtmlDocument::hasClass(const xmlNode* node, const std::string& cls) {
    std::istringstream in(attribute(node, "class"));
    std::string token;
    while (in >> token) {
        if (token == cls) return true;
    }
    return false;
}

xmlNode* HtmlDocument::nearestAncestor(const xmlNode* node, const char* tagName) {
    if (!node) return nullptr;
    for (xmlNode* p = node->parent; p; p = p->parent) {
        if (isElement(p, tagName)) {
            return p;
        }
    }
    return nullptr;
}

std::vector<xmlNode*> HtmlDocument::childElements(const xmlNode* node, const char* tagName) {
    std::vector<xmlNode*> out;
    if (!node) return out;
    for (xmlNode* c = node->children; c; c = c->next) {
        if (isElement(c, tagName)) {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> HtmlDocument::textContent(const xmlNode* node) {
    if (!node) return std::nullopt;
    if (node->type == XML_ELEMENT_NODE && !node->children) return std::string();
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) return std::nullopt;
    std::string s = reinterpret_cast<const char*>(content);
    xmlFree(content);
    return s;
}

std::string trimText(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e) {
        if (std::isspace(static_cast<unsigned char>(s[b]))) {
            ++b;
        } else if (b + 1 < e && static_cast<unsigned char>(s[b]) == 0xC2 &&
                   static_cast<unsigned char>(s[b + 1]) == 0xA0) {
            b += 2;
        } else {
            break;
        }
    }
    while (e > b) {
        if (std::isspace(static_cast<unsigned char>(s[e - 1]))) {
            --e;
        } else if (e - b >= 2 && static_cast<unsigned char>(s[e - 2]) == 0xC2 &&
                   static_cast<unsigned char>(s[e - 1]) == 0xA0) {
            e -= 2;
        } else {
            break;
        }
    }
    return s.substr(b, e - b);
}

std::string collapseNbsp(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (i + 1 < s.size() && static_cast<unsigned char>(s[i]) == 0xC2 &&
            static_cast<unsigned char>(s[i + 1]) == 0xA0) {
            out.push_back(' ');
            ++i;
            continue;
        }
        out.push_back(s[i]);
    }
    return out;
}

} // namespace gw::agent::infra::html
