#include "mcptools/tools/builtin.hpp"

#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>

#include "mcptools/core/logger.hpp"

namespace mcptools::tools {

auto regex_replace_in_file(const std::filesystem::path& path,
                           const std::string& pattern,
                           const std::string& replacement) -> Result<RegexReplaceOutcome>
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "File not found", path.string()));
    }

    std::regex re;
    try {
        re = std::regex(pattern);
    } catch (const std::regex_error& e) {
        return std::unexpected(make_error(
            ErrorCode::InvalidArgument, "Invalid regex pattern", e.what()));
    }

    std::string content;
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return std::unexpected(make_error(
                ErrorCode::IoError, "Cannot open file", path.string()));
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        content = ss.str();
    }

    auto begin = std::sregex_iterator(content.begin(), content.end(), re);
    auto matches = static_cast<std::size_t>(std::distance(begin, std::sregex_iterator()));

    if (matches != 1) {
        return RegexReplaceOutcome{
            .matches = matches,
            .replaced = false,
            .message = matches == 0
                ? "No matches found, no changes made."
                : "Found " + std::to_string(matches) + " matches instead of exactly one, no changes made.",
        };
    }

    auto updated = std::regex_replace(content, re, replacement,
                                      std::regex_constants::format_first_only);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out || !(out << updated) || !out.flush()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Cannot write file", path.string()));
    }

    LOG_INFO("regex_replace: updated {}", path.string());
    return RegexReplaceOutcome{
        .matches = 1,
        .replaced = true,
        .message = "Replacement successful",
    };
}

auto make_regex_replace_tool() -> ToolDescriptor {
    return ToolDescriptor{
        .name = "regex_replace",
        .description =
            "Replace text in a file using a regular expression. The file is "
            "only changed when the pattern matches exactly once; otherwise "
            "the number of matches is reported and nothing is written.",
        .parameters = {.fields = {
            {.name = "file_path", .kind = schema::FieldKind::String,
             .description = "Path of the file to edit"},
            {.name = "pattern", .kind = schema::FieldKind::String,
             .description = "ECMAScript regular expression"},
            {.name = "replacement", .kind = schema::FieldKind::String,
             .description = "Replacement text; $1, $2 ... refer to groups"},
        }},
        .handler = SyncHandler{
            [](const json& args) -> Result<ToolOutput> {
                auto outcome = regex_replace_in_file(
                    args.at("file_path").get<std::string>(),
                    args.at("pattern").get<std::string>(),
                    args.at("replacement").get<std::string>());
                if (!outcome) {
                    return std::unexpected(outcome.error());
                }
                return ToolOutput{
                    .content = outcome->message,
                    .is_error = !outcome->replaced,
                };
            }},
    };
}

} // namespace mcptools::tools
