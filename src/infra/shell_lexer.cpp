#include "delguard/infra/shell_lexer.hpp"

#include "delguard/core/logger.hpp"

namespace delguard::infra {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // anonymous namespace

auto split_posix(std::string_view input) -> Result<std::vector<std::string>> {
    enum class State { Space, Word, Single, Double };

    std::vector<std::string> tokens;
    std::string current;
    auto state = State::Space;

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        switch (state) {
            case State::Space:
            case State::Word:
                if (is_space(c)) {
                    if (state == State::Word) {
                        tokens.push_back(std::move(current));
                        current.clear();
                    }
                    state = State::Space;
                } else if (c == '\'') {
                    state = State::Single;
                } else if (c == '"') {
                    state = State::Double;
                } else if (c == '\\') {
                    if (i + 1 >= input.size()) {
                        return std::unexpected(make_error(
                            ErrorCode::InvalidArgument, "No escaped character"));
                    }
                    current += input[++i];
                    state = State::Word;
                } else {
                    current += c;
                    state = State::Word;
                }
                break;

            case State::Single:
                if (c == '\'') {
                    state = State::Word;
                } else {
                    current += c;
                }
                break;

            case State::Double:
                if (c == '"') {
                    state = State::Word;
                } else if (c == '\\') {
                    if (i + 1 >= input.size()) {
                        return std::unexpected(make_error(
                            ErrorCode::InvalidArgument, "No escaped character"));
                    }
                    char next = input[++i];
                    // Inside double quotes only the quote and the escape
                    // character itself are escapable.
                    if (next != '"' && next != '\\') {
                        current += '\\';
                    }
                    current += next;
                } else {
                    current += c;
                }
                break;
        }
    }

    if (state == State::Single || state == State::Double) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "No closing quotation", std::string(input)));
    }
    if (state == State::Word) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

auto split_permissive(std::string_view input) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    size_t i = 0;

    while (i < input.size()) {
        while (i < input.size() && is_space(input[i])) ++i;
        if (i >= input.size()) break;

        size_t start = i;
        char first = input[i];
        if (first == '\'' || first == '"') {
            // A quoted token runs to its matching quote, or to the end.
            auto close = input.find(first, i + 1);
            i = close == std::string_view::npos ? input.size() : close + 1;
        } else {
            while (i < input.size() && !is_space(input[i])) ++i;
        }
        tokens.emplace_back(input.substr(start, i - start));
    }
    return tokens;
}

auto split_command(std::string_view input) -> std::vector<std::string> {
    auto tokens = split_posix(input);
    if (tokens) {
        return std::move(*tokens);
    }
    LOG_DEBUG("POSIX tokenization failed ({}), retrying permissively",
              tokens.error().what());
    return split_permissive(input);
}

} // namespace delguard::infra
