#include "BioExtractor.hpp"
#include "../utils/Logger.hpp"
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstring> // For strlen
#include <regex>
#include <vector>

namespace {

// Helper to convert lxb_char_t* to std::string
std::string to_std_string(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

const lxb_char_t* as_lxb(const char* s) {
    return reinterpret_cast<const lxb_char_t*>(s);
}

// Helper to get an attribute value by key
std::string get_attribute_value(lxb_dom_element_t* element, const char* key) {
    size_t len = 0;
    const lxb_char_t* value = lxb_dom_element_get_attribute(element, as_lxb(key), strlen(key), &len);
    return to_std_string(value, len);
}

// ASCII lowercase helper
inline void ascii_tolower_inplace(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
}

std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// Owns a parsed lexbor document for the duration of one extraction.
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html) {
        document_ = lxb_html_document_create();
        if (!document_) return;
        lxb_status_t status = lxb_html_document_parse(document_,
            reinterpret_cast<const lxb_char_t*>(html.c_str()), html.length());
        if (status != LXB_STATUS_OK) {
            lxb_html_document_destroy(document_);
            document_ = nullptr;
        }
    }

    ~HtmlDocument() {
        if (document_) lxb_html_document_destroy(document_);
    }

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    bool IsValid() const { return document_ != nullptr; }

    std::vector<lxb_dom_element_t*> ElementsByTag(const char* tag) const {
        return Collect([tag](lxb_dom_element_t* root, lxb_dom_collection_t* col) {
            return lxb_dom_elements_by_tag_name(root, col, as_lxb(tag), strlen(tag));
        });
    }

    std::vector<lxb_dom_element_t*> ElementsByAttr(const char* name, const char* value, bool case_insensitive) const {
        return Collect([=](lxb_dom_element_t* root, lxb_dom_collection_t* col) {
            return lxb_dom_elements_by_attr(root, col, as_lxb(name), strlen(name),
                                            as_lxb(value), strlen(value), case_insensitive);
        });
    }

    // Text of the element and its descendants, markup stripped.
    std::string TextContent(lxb_dom_element_t* element) const {
        size_t len = 0;
        lxb_dom_node_t* node = lxb_dom_interface_node(element);
        lxb_char_t* text = lxb_dom_node_text_content(node, &len);
        if (!text) return "";
        std::string result = to_std_string(text, len);
        lxb_dom_document_destroy_text(DomDocument(), text);
        return result;
    }

private:
    lxb_dom_document_t* DomDocument() const {
        return lxb_html_document_original_ref(document_);
    }

    template <typename Query>
    std::vector<lxb_dom_element_t*> Collect(Query query) const {
        std::vector<lxb_dom_element_t*> elements;
        if (!document_) return elements;

        lxb_dom_document_t* dom_doc = DomDocument();
        lxb_dom_element_t* root = lxb_dom_document_element(dom_doc);
        if (!root) return elements;

        lxb_dom_collection_t* col = lxb_dom_collection_make(dom_doc, 16);
        if (!col) return elements;

        if (query(root, col) == LXB_STATUS_OK) {
            const size_t count = lxb_dom_collection_length(col);
            elements.reserve(count);
            for (size_t i = 0; i < count; ++i) {
                lxb_dom_element_t* el = lxb_dom_collection_element(col, i);
                if (el) elements.push_back(el);
            }
        }
        lxb_dom_collection_destroy(col, true);
        return elements;
    }

    lxb_html_document_t* document_ = nullptr;
};

using BioResult = std::optional<std::string>;

// 1) <script type="application/ld+json"> with a top-level "description".
BioResult FromStructuredData(const HtmlDocument& doc) {
    auto scripts = doc.ElementsByAttr("type", "application/ld+json", true);
    if (scripts.empty()) return std::nullopt;

    try {
        auto data = nlohmann::json::parse(doc.TextContent(scripts.front()));
        if (!data.is_object()) return std::nullopt;
        auto it = data.find("description");
        if (it != data.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
            return it->get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        BioVerify::Logger::Log(BioVerify::LogLevel::Debug, "ld+json parsing failed: " + std::string(e.what()));
    }
    return std::nullopt;
}

// 2) <meta name="description" content="...">
BioResult FromMetaDescription(const HtmlDocument& doc) {
    for (lxb_dom_element_t* el : doc.ElementsByTag("meta")) {
        std::string name = get_attribute_value(el, "name");
        ascii_tolower_inplace(name);
        if (name != "description") continue;

        std::string content = get_attribute_value(el, "content");
        if (content.empty()) return std::nullopt;
        return content;
    }
    return std::nullopt;
}

// Returns the balanced {...} starting at text[start], honouring string literals.
std::optional<std::string> ExtractObjectLiteral(const std::string& text, size_t start) {
    if (start >= text.size() || text[start] != '{') return std::nullopt;

    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    char quote = '\0';
    for (size_t i = start; i < text.size(); ++i) {
        const char c = text[i];
        if (in_string) {
            if (escaped) escaped = false;
            else if (c == '\\') escaped = true;
            else if (c == quote) in_string = false;
            continue;
        }
        if (c == '"' || c == '\'') {
            in_string = true;
            quote = c;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) return text.substr(start, i - start + 1);
        }
    }
    return std::nullopt;
}

// The state blob appears either as a window['SIGI_STATE'] = {...}; assignment
// or as a <script id="SIGI_STATE"> holding plain JSON.
std::optional<std::string> FindStateBlob(const HtmlDocument& doc) {
    for (lxb_dom_element_t* el : doc.ElementsByAttr("id", "SIGI_STATE", false)) {
        std::string text = trim(doc.TextContent(el));
        if (!text.empty() && text.front() == '{') return text;
    }

    static const std::regex assignment(R"(window\[\s*['"]SIGI_STATE['"]\s*\]\s*=\s*)");
    for (lxb_dom_element_t* el : doc.ElementsByTag("script")) {
        std::string text = doc.TextContent(el);
        if (text.find("SIGI_STATE") == std::string::npos) continue;
        std::smatch match;
        if (!std::regex_search(text, match, assignment)) continue;
        size_t start = static_cast<size_t>(match.position(0) + match.length(0));
        if (auto literal = ExtractObjectLiteral(text, start)) return literal;
    }
    return std::nullopt;
}

// UserModule.users keeps insertion order in the page, hence ordered_json.
const nlohmann::ordered_json* FindUserRecord(const nlohmann::ordered_json& state) {
    if (!state.is_object()) return nullptr;

    auto user_module = state.find("UserModule");
    if (user_module != state.end() && user_module->is_object()) {
        auto users = user_module->find("users");
        if (users != user_module->end() && users->is_object() && !users->empty()) {
            return &users->begin().value();
        }
    }

    auto user_page = state.find("UserPage");
    if (user_page != state.end() && user_page->is_object()) {
        auto user = user_page->find("user");
        if (user != user_page->end()) {
            return &user.value();
        }
    }
    return nullptr;
}

// 3) SIGI_STATE client state: the user record's "signature".
BioResult FromStateBlob(const HtmlDocument& doc) {
    auto blob = FindStateBlob(doc);
    if (!blob) return std::nullopt;

    try {
        auto state = nlohmann::ordered_json::parse(*blob);
        const auto* user = FindUserRecord(state);
        if (!user || !user->is_object()) return std::nullopt;
        auto signature = user->find("signature");
        if (signature != user->end() && signature->is_string() && !signature->get_ref<const std::string&>().empty()) {
            return signature->get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        BioVerify::Logger::Log(BioVerify::LogLevel::Debug, "SIGI_STATE parsing failed: " + std::string(e.what()));
    }
    return std::nullopt;
}

// 4) Element tagged data-e2e="user-bio", nested markup stripped.
BioResult FromBioElement(const HtmlDocument& doc) {
    auto elements = doc.ElementsByAttr("data-e2e", "user-bio", false);
    if (elements.empty()) return std::nullopt;

    std::string text = trim(doc.TextContent(elements.front()));
    if (text.empty()) return std::nullopt;
    return text;
}

struct Strategy {
    const char* name;
    BioResult (*extract)(const HtmlDocument&);
};

const Strategy kStrategies[] = {
    {"JSON-LD", FromStructuredData},
    {"meta description", FromMetaDescription},
    {"SIGI_STATE", FromStateBlob},
    {"bio element", FromBioElement},
};

} // anonymous namespace

namespace BioVerify {

std::optional<std::string> BioExtractor::ExtractBio(const std::string& html_content) {
    HtmlDocument doc(html_content);
    if (!doc.IsValid()) {
        Logger::Log(LogLevel::Warn, "Failed to parse HTML document");
        return std::nullopt;
    }

    for (const auto& strategy : kStrategies) {
        try {
            if (auto bio = strategy.extract(doc)) {
                Logger::Log(LogLevel::Debug, std::string("Bio found via ") + strategy.name);
                return bio;
            }
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Debug, std::string(strategy.name) + " extraction failed: " + e.what());
        }
    }

    Logger::Log(LogLevel::Debug, "No bio pattern matched");
    return std::nullopt;
}

}
