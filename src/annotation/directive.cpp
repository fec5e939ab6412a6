#include "annotation/directive.hpp"

#include "log/log.hpp"

namespace notate::annotation {

namespace {

auto is_ident_start(char c) -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

auto is_ident_char(char c) -> bool {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

auto is_horizontal_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

auto is_space(char c) -> bool {
    return is_horizontal_space(c) || c == '\n' || c == '\r';
}

/// A directive may only start at the beginning of the text or after
/// whitespace or comment decoration.
auto can_start_directive(std::string_view text, size_t pos) -> bool {
    if (pos == 0) {
        return true;
    }
    char prev = text[pos - 1];
    return is_space(prev) || prev == '*' || prev == '/';
}

auto trim_right(std::string_view s) -> std::string_view {
    size_t end = s.size();
    while (end > 0 && is_space(s[end - 1])) {
        --end;
    }
    return s.substr(0, end);
}

} // namespace

auto extract_directives(std::string_view comment) -> std::vector<RawInvocation> {
    std::vector<RawInvocation> directives;

    size_t pos = 0;
    while (pos < comment.size()) {
        size_t bang = comment.find('!', pos);
        if (bang == std::string_view::npos) {
            break;
        }
        pos = bang + 1;

        if (!can_start_directive(comment, bang) || pos >= comment.size() ||
            !is_ident_start(comment[pos])) {
            continue;
        }

        size_t name_end = pos;
        while (name_end < comment.size() && is_ident_char(comment[name_end])) {
            ++name_end;
        }

        size_t args_start = name_end;
        while (args_start < comment.size() && is_horizontal_space(comment[args_start])) {
            ++args_start;
        }

        size_t line_end = comment.find_first_of("\r\n", args_start);
        if (line_end == std::string_view::npos) {
            line_end = comment.size();
        }
        size_t args_end = line_end;
        size_t close = comment.find("*/", args_start);
        if (close != std::string_view::npos && close < line_end) {
            args_end = close;
        }

        RawInvocation invocation;
        invocation.name = std::string(comment.substr(pos, name_end - pos));
        invocation.argument_text =
            std::string(trim_right(comment.substr(args_start, args_end - args_start)));
        invocation.offset = bang;

        NOTATE_LOG_TRACE("directive", "Found !" << invocation.name << " at offset " << bang
                                                << " args '" << invocation.argument_text << "'");

        directives.push_back(std::move(invocation));

        // Scanning resumes after the comment terminator, or on the next line
        pos = args_end < line_end ? args_end + 2 : line_end;
    }

    return directives;
}

} // namespace notate::annotation
