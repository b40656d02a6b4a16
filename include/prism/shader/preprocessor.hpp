// Prism Shader Core
// preprocessor.hpp - Recursive #include expansion

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prism::shader {

class SourceReader;

// Expands `#include "path"` and `#include <path>` directives.
//
// A directive must occupy its own line: optional leading whitespace, the
// keyword, whitespace, a quoted path, optional trailing whitespace. Lines that
// do not match exactly are passed through untouched for the compiler to see.
//
// Include paths resolve relative to the directory of the file containing the
// directive; a leading '/' makes them relative to the reader's root. The
// directive line is replaced by the expanded text in place, so the lines
// before and after keep their relative order.
class SourcePreprocessor {
public:
    explicit SourcePreprocessor(const SourceReader& reader);

    // Expand `source`, which was read from `source_path` (empty for inline text).
    // Throws ShaderError: CyclicInclude, ResourceNotFound, IoError.
    [[nodiscard]] std::string process(std::string_view source, const std::string& source_path = {}) const;

    // Read `path` through the reader and expand it
    [[nodiscard]] std::string process_file(const std::string& path) const;

    // Path named by an include directive line, if the line is one
    [[nodiscard]] static std::optional<std::string> parse_include_directive(std::string_view line);

    // Logical path of `include_path` as seen from the file at `including_path`
    [[nodiscard]] static std::string resolve_include_path(std::string_view including_path,
                                                          std::string_view include_path);

private:
    // `stack` holds identities of the files currently being expanded
    std::string expand(std::string_view source, const std::string& source_path,
                       std::vector<std::string>& stack) const;

    const SourceReader& reader_;
};

}  // namespace prism::shader
