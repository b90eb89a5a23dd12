// EN: StorageServiceProperties XML codec. Top-level elements are split without interpreting them;
//     only <StaticWebsite> is decoded and re-encoded.
// FR: Codec XML StorageServiceProperties. Les éléments de premier niveau sont découpés sans être
//     interprétés ; seul <StaticWebsite> est décodé et ré-encodé.

#include "storage/service_properties_codec.hpp"

#include <algorithm>
#include <cctype>

namespace SSD::Storage::ServicePropertiesCodec {

namespace {

const std::string kRootName = "StorageServiceProperties";
const std::string kStaticWebsite = "StaticWebsite";

bool isNameTerminator(char c) {
    return std::isspace(static_cast<unsigned char>(c)) || c == '>' || c == '/';
}

bool startsWithAt(const std::string& text, size_t pos, const std::string& prefix) {
    return text.compare(pos, prefix.size(), prefix) == 0;
}

// EN: Position just past the closing tag matching the element opened before `pos`.
// FR: Position juste après la balise fermante correspondant à l'élément ouvert avant `pos`.
size_t findElementEnd(const std::string& xml, const std::string& name, size_t pos, size_t limit) {
    const std::string open_prefix = "<" + name;
    const std::string close_tag = "</" + name + ">";
    int depth = 1;

    while (pos < limit) {
        const size_t lt = xml.find('<', pos);
        if (lt == std::string::npos || lt >= limit) {
            break;
        }
        if (startsWithAt(xml, lt, close_tag)) {
            if (--depth == 0) {
                return lt + close_tag.size();
            }
            pos = lt + close_tag.size();
            continue;
        }
        if (startsWithAt(xml, lt, open_prefix) && lt + open_prefix.size() < xml.size() &&
            isNameTerminator(xml[lt + open_prefix.size()])) {
            const size_t gt = xml.find('>', lt);
            if (gt == std::string::npos) {
                break;
            }
            if (xml[gt - 1] != '/') {
                ++depth;
            }
            pos = gt + 1;
            continue;
        }
        pos = lt + 1;
    }
    throw ServicePropertiesFormatError("Unterminated element <" + name + ">");
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string childText(const std::string& element, const std::string& child) {
    const std::string open_tag = "<" + child + ">";
    const auto begin = element.find(open_tag);
    if (begin == std::string::npos) {
        return {};
    }
    const auto content_begin = begin + open_tag.size();
    const auto end = element.find("</" + child + ">", content_begin);
    if (end == std::string::npos) {
        throw ServicePropertiesFormatError("Unterminated element <" + child + ">");
    }
    return unescapeXml(trim(element.substr(content_begin, end - content_begin)));
}

StaticWebsiteProperties parseStaticWebsite(const std::string& element) {
    StaticWebsiteProperties website;
    std::string enabled = childText(element, "Enabled");
    std::transform(enabled.begin(), enabled.end(), enabled.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    website.enabled = enabled == "true";
    website.index_document = childText(element, "IndexDocument");
    website.error_document_404_path = childText(element, "ErrorDocument404Path");
    website.default_index_document_path = childText(element, "DefaultIndexDocumentPath");
    return website;
}

void appendStaticWebsite(std::string& out, const StaticWebsiteProperties& website) {
    out += "<StaticWebsite><Enabled>";
    out += website.enabled ? "true" : "false";
    out += "</Enabled>";
    if (website.enabled) {
        if (!website.index_document.empty()) {
            out += "<IndexDocument>" + escapeXml(website.index_document) + "</IndexDocument>";
        }
        if (!website.error_document_404_path.empty()) {
            out += "<ErrorDocument404Path>" + escapeXml(website.error_document_404_path) +
                   "</ErrorDocument404Path>";
        }
        if (!website.default_index_document_path.empty()) {
            out += "<DefaultIndexDocumentPath>" + escapeXml(website.default_index_document_path) +
                   "</DefaultIndexDocumentPath>";
        }
    }
    out += "</StaticWebsite>";
}

} // namespace

ServiceProperties parse(const std::string& xml) {
    ServiceProperties properties;

    const auto root_open = xml.find("<" + kRootName);
    if (root_open == std::string::npos) {
        throw ServicePropertiesFormatError("Missing <" + kRootName + "> element");
    }
    const auto root_tag_end = xml.find('>', root_open);
    if (root_tag_end == std::string::npos) {
        throw ServicePropertiesFormatError("Malformed <" + kRootName + "> tag");
    }
    if (xml[root_tag_end - 1] == '/') {
        return properties;
    }
    const auto root_close = xml.rfind("</" + kRootName + ">");
    if (root_close == std::string::npos || root_close < root_tag_end) {
        throw ServicePropertiesFormatError("Unterminated <" + kRootName + "> element");
    }

    size_t pos = root_tag_end + 1;
    while (pos < root_close) {
        while (pos < root_close && std::isspace(static_cast<unsigned char>(xml[pos]))) {
            ++pos;
        }
        if (pos >= root_close) {
            break;
        }
        if (xml[pos] != '<') {
            throw ServicePropertiesFormatError("Unexpected text inside <" + kRootName + ">");
        }
        if (startsWithAt(xml, pos, "<!--")) {
            const auto comment_end = xml.find("-->", pos);
            if (comment_end == std::string::npos) {
                throw ServicePropertiesFormatError("Unterminated comment");
            }
            pos = comment_end + 3;
            continue;
        }

        size_t name_end = pos + 1;
        while (name_end < root_close && !isNameTerminator(xml[name_end])) {
            ++name_end;
        }
        const std::string name = xml.substr(pos + 1, name_end - pos - 1);
        if (name.empty()) {
            throw ServicePropertiesFormatError("Empty element name");
        }
        const auto tag_end = xml.find('>', pos);
        if (tag_end == std::string::npos || tag_end >= root_close) {
            throw ServicePropertiesFormatError("Malformed tag <" + name + ">");
        }

        const size_t element_end = xml[tag_end - 1] == '/'
            ? tag_end + 1
            : findElementEnd(xml, name, tag_end + 1, root_close);
        const std::string element = xml.substr(pos, element_end - pos);

        if (name == kStaticWebsite) {
            properties.static_website = parseStaticWebsite(element);
            properties.static_website_position = properties.preserved_elements.size();
        } else {
            properties.preserved_elements.push_back({name, element});
        }
        pos = element_end;
    }

    return properties;
}

std::string serialize(const ServiceProperties& properties) {
    std::string out = "<?xml version=\"1.0\" encoding=\"utf-8\"?><" + kRootName + ">";
    const size_t position = std::min(properties.static_website_position,
                                     properties.preserved_elements.size());
    for (size_t i = 0; i < properties.preserved_elements.size(); ++i) {
        if (i == position) {
            appendStaticWebsite(out, properties.static_website);
        }
        out += properties.preserved_elements[i].xml;
    }
    if (position == properties.preserved_elements.size()) {
        appendStaticWebsite(out, properties.static_website);
    }
    out += "</" + kRootName + ">";
    return out;
}

std::string escapeXml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string unescapeXml(const std::string& text) {
    static const std::pair<const char*, char> kEntities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}};

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& [entity, value] : kEntities) {
                if (startsWithAt(text, i, entity)) {
                    out += value;
                    i += std::char_traits<char>::length(entity);
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            out += text[i++];
        }
    }
    return out;
}

} // namespace SSD::Storage::ServicePropertiesCodec
