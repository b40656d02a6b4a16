// Prism Shader Core
// preprocessor.cpp - Recursive #include expansion

#include <prism/core/logger.hpp>
#include <prism/shader/preprocessor.hpp>
#include <prism/shader/shader_error.hpp>
#include <prism/shader/source_reader.hpp>

#include <algorithm>
#include <filesystem>

namespace prism::shader {

namespace {

constexpr std::string_view INCLUDE_KEYWORD = "#include";

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

SourcePreprocessor::SourcePreprocessor(const SourceReader& reader) : reader_(reader) {}

std::optional<std::string> SourcePreprocessor::parse_include_directive(std::string_view line) {
    std::string_view text = trim(line);
    if (text.substr(0, INCLUDE_KEYWORD.size()) != INCLUDE_KEYWORD) {
        return std::nullopt;
    }
    text.remove_prefix(INCLUDE_KEYWORD.size());

    // At least one whitespace character between keyword and path
    if (text.empty() || !is_space(text.front())) {
        return std::nullopt;
    }
    text = trim(text);
    if (text.size() < 3) {
        return std::nullopt;
    }

    char open = text.front();
    char close = open == '"' ? '"' : (open == '<' ? '>' : '\0');
    if (close == '\0' || text.back() != close) {
        return std::nullopt;
    }

    std::string_view path = text.substr(1, text.size() - 2);
    if (path.find_first_of("\"<>") != std::string_view::npos) {
        return std::nullopt;
    }
    return std::string(path);
}

std::string SourcePreprocessor::resolve_include_path(std::string_view including_path, std::string_view include_path) {
    if (!include_path.empty() && include_path.front() == '/') {
        return normalize_logical_path(include_path);
    }

    // A file opened by absolute path keeps its includes beside it on disk
    std::filesystem::path including(including_path);
    if (including.is_absolute()) {
        return (including.parent_path() / std::filesystem::path(include_path)).lexically_normal().generic_string();
    }

    std::string directory = logical_directory(including_path);
    if (directory.empty()) {
        return normalize_logical_path(include_path);
    }
    return normalize_logical_path(directory + "/" + std::string(include_path));
}

std::string SourcePreprocessor::process(std::string_view source, const std::string& source_path) const {
    std::vector<std::string> stack;
    if (!source_path.empty()) {
        stack.push_back(reader_.resolve_identity(source_path));
    }
    return expand(source, source_path, stack);
}

std::string SourcePreprocessor::process_file(const std::string& path) const {
    std::string source = reader_.read_text(path);
    return process(source, path);
}

std::string SourcePreprocessor::expand(std::string_view source, const std::string& source_path,
                                       std::vector<std::string>& stack) const {
    std::string result;
    result.reserve(source.size());

    size_t line_start = 0;
    while (line_start <= source.size()) {
        size_t line_end = source.find('\n', line_start);
        bool has_newline = line_end != std::string_view::npos;
        if (!has_newline) {
            line_end = source.size();
        }
        std::string_view line = source.substr(line_start, line_end - line_start);

        auto include = parse_include_directive(line);
        if (!include) {
            result.append(line);
        } else {
            std::string resolved = resolve_include_path(source_path, *include);
            std::string identity = reader_.resolve_identity(resolved);

            if (std::find(stack.begin(), stack.end(), identity) != stack.end()) {
                PRISM_LOG_ERROR(core::log_category::PREPROCESSOR, "Cyclic #include of '{}' from '{}'", resolved,
                                source_path);
                throw ShaderError::cyclic_include(resolved);
            }

            std::string included = reader_.read_text(resolved);

            stack.push_back(identity);
            std::string expanded = expand(included, resolved, stack);
            stack.pop_back();

            PRISM_LOG_TRACE(core::log_category::PREPROCESSOR, "Expanded '{}' into '{}'", resolved, source_path);
            result.append(expanded);
        }

        if (!has_newline) {
            break;
        }
        result.push_back('\n');
        line_start = line_end + 1;
    }

    return result;
}

}  // namespace prism::shader
