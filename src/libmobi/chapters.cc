//
// Heading-driven chapter segmentation.
//

#include <mobi/chapters.hh>
#include <mobi/exceptions.hh>
#include "utf8.hh"

#include <algorithm>

namespace mobi {

    namespace {
        struct heading {
            std::size_t start;
            std::string title;
        };

        std::string trim_line(std::string_view line) {
            auto first = line.find_first_not_of(" \t");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = line.find_last_not_of(" \t");
            return std::string(line.substr(first, last - first + 1));
        }

        std::vector<heading> find_headings(std::string_view text, const std::regex& re, std::size_t max_prefix) {
            std::vector<heading> found;
            std::size_t line_start = 0;
            while (line_start < text.size()) {
                auto line_end = text.find('\n', line_start);
                if (line_end == std::string_view::npos) {
                    line_end = text.size();
                }

                auto line = text.substr(line_start, line_end - line_start);
                auto prefix = line.substr(0, utf8::boundary_before(line, max_prefix));

                std::match_results<std::string_view::const_iterator> m;
                if (!prefix.empty() &&
                    std::regex_search(prefix.begin(), prefix.end(), m, re, std::regex_constants::match_continuous)) {
                    found.push_back({line_start, trim_line(prefix)});
                }
                line_start = line_end + 1;
            }
            return found;
        }
    }

    std::vector<chapter_pattern> default_chapter_patterns() {
        constexpr auto flags = std::regex::ECMAScript | std::regex::icase;
        return {
            {"Chapter N", std::regex(R"([ \t]*Chapter[ \t]+[0-9]+)", flags)},
            {"CHAPTER N", std::regex(R"([ \t]*CHAPTER[ \t]+[0-9]+)", flags)},
            {"N. ", std::regex(R"([ \t]*[0-9]+\.(?:[ \t]+|$))", flags)},
            {"IVX. ", std::regex(R"([ \t]*[IVX]+\.(?:[ \t]+|$))", flags)},
        };
    }

    std::vector<chapter> segment_chapters(std::string_view text, const std::string& book_id,
                                          const std::vector<chapter_pattern>& patterns,
                                          const decode_options& options) {
        std::vector<chapter> chapters;
        if (text.empty()) {
            return chapters;
        }

        auto add = [&](std::size_t start, std::size_t end, std::string title) {
            if (start >= end) {
                return;
            }
            chapter c;
            c.id = "chapter_" + std::to_string(chapters.size());
            c.title = title.empty() ? "Chapter " + std::to_string(chapters.size() + 1) : std::move(title);
            c.start_index = start;
            c.end_index = end;
            c.book_id = book_id;
            chapters.push_back(std::move(c));
        };

        std::vector<heading> headings;
        for (const auto& pattern : patterns) {
            headings = find_headings(text, pattern.heading, options.max_heading_length);
            if (!headings.empty()) {
                break;
            }
        }

        if (headings.empty()) {
            add(0, text.size(), whole_text_title);
            return chapters;
        }

        if (headings.size() > options.max_chapters && options.max_chapters > 0) {
            options.warn(headings[options.max_chapters].start, "size_limit",
                         build_error_msg(headings.size(), " chapter headings found, keeping the first ",
                                         options.max_chapters));
            headings.resize(options.max_chapters);
        }

        add(0, headings.front().start, front_matter_title);
        for (std::size_t i = 0; i < headings.size(); i++) {
            std::size_t end = (i + 1 < headings.size()) ? headings[i + 1].start : text.size();
            add(headings[i].start, end, std::move(headings[i].title));
        }
        return chapters;
    }

} // namespace mobi
