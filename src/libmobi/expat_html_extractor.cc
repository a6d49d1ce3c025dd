//
// Markup-to-text extraction on top of expat.
//

#include <mobi/content.hh>
#include <mobi/exceptions.hh>

#include <expat.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <memory>
#include <set>
#include <string>

namespace mobi {

    namespace {
        const std::set<std::string> skipped_elements = {"head", "script", "style", "title"};

        const std::set<std::string> block_elements = {
            "p", "div", "br", "h1", "h2", "h3", "h4", "h5", "h6", "li", "tr",
            "blockquote", "pagebreak", "section", "article", "hr", "ul", "ol", "table"
        };

        constexpr const char* root_element = "mobi-fragment";

        // Lowercase local name, "mbp:pagebreak" -> "pagebreak"
        std::string local_name(const XML_Char* name) {
            std::string s(name);
            auto colon = s.rfind(':');
            if (colon != std::string::npos) {
                s.erase(0, colon + 1);
            }
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        struct extraction_state {
            std::string all_text;
            std::string body_text;
            int skip_depth = 0;
            int body_depth = 0;
            bool saw_body = false;

            void append(const char* s, std::size_t len) {
                if (skip_depth > 0) {
                    return;
                }
                all_text.append(s, len);
                if (body_depth > 0) {
                    body_text.append(s, len);
                }
            }
        };

        void XMLCALL start_element(void* user_data, const XML_Char* name, const XML_Char**) {
            auto* state = static_cast<extraction_state*>(user_data);
            auto element = local_name(name);

            if (state->skip_depth > 0 || skipped_elements.count(element)) {
                state->skip_depth++;
                return;
            }
            if (element == "body") {
                state->saw_body = true;
            }
            if (element == "body" || state->body_depth > 0) {
                state->body_depth++;
            }
        }

        void XMLCALL end_element(void* user_data, const XML_Char* name) {
            auto* state = static_cast<extraction_state*>(user_data);
            if (state->skip_depth > 0) {
                state->skip_depth--;
                return;
            }

            if (block_elements.count(local_name(name))) {
                state->append("\n", 1);
            }
            if (state->body_depth > 0) {
                state->body_depth--;
            }
        }

        void XMLCALL character_data(void* user_data, const XML_Char* s, int len) {
            auto* state = static_cast<extraction_state*>(user_data);
            if (len > 0) {
                state->append(s, static_cast<std::size_t>(len));
            }
        }

        struct parser_deleter {
            void operator()(XML_ParserStruct* parser) const {
                XML_ParserFree(parser);
            }
        };

        using parser_ptr = std::unique_ptr<XML_ParserStruct, parser_deleter>;
    }

    std::string expat_html_extractor::extract(std::string_view markup) const {
        std::string document;
        document.reserve(markup.size() + 64);
        document.append("<").append(root_element).append(">");
        document.append(markup.data(), markup.size());
        document.append("</").append(root_element).append(">");

        if (document.size() > static_cast<std::size_t>(INT_MAX)) {
            THROW_MARKUP("Markup fragment of ", markup.size(), " bytes is too large");
        }

        parser_ptr parser(XML_ParserCreate("UTF-8"));
        if (!parser) {
            THROW_MARKUP("Failed to create XML parser");
        }

        extraction_state state;
        XML_SetUserData(parser.get(), &state);
        XML_SetElementHandler(parser.get(), start_element, end_element);
        XML_SetCharacterDataHandler(parser.get(), character_data);

        if (XML_Parse(parser.get(), document.data(), static_cast<int>(document.size()), XML_TRUE) ==
            XML_STATUS_ERROR) {
            THROW_MARKUP("Markup parse error at line ", XML_GetCurrentLineNumber(parser.get()),
                         ", column ", XML_GetCurrentColumnNumber(parser.get()), ": ",
                         XML_ErrorString(XML_GetErrorCode(parser.get())));
        }

        return state.saw_body ? state.body_text : state.all_text;
    }

} // namespace mobi
