#include "prodconf/unit_parser.hpp"
#include "prodconf/file_utils.hpp"
#include "prodconf/string_utils.hpp"

#include <optional>  // for optional
#include <string>    // for string
#include <utility>   // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using prodconf::Error;
using prodconf::ErrorKind;

// Key whose value is still being collected.
struct PendingEntry final {
    std::string key{};
    std::string inline_value{};
    std::vector<std::string> items{};
    std::size_t line{};
};

class UnitParser final {
 public:
    UnitParser(std::string_view text, std::string_view path, const prodconf::ParseOptions& options) noexcept
      : m_text(text), m_options(options) {
        m_file.path = std::string{path};
    }

    auto parse() noexcept -> std::expected<prodconf::ConfigFile, Error> {
        while (auto logical = next_logical_line()) {
            if (!logical->has_value()) {
                return std::unexpected(std::move(logical->error()));
            }
            const auto& [line_no, content] = logical->value();
            if (auto result = process_line(line_no, content); !result) {
                return std::unexpected(std::move(result.error()));
            }
        }
        if (auto result = flush_pending(); !result) {
            return std::unexpected(std::move(result.error()));
        }
        return std::move(m_file);
    }

 private:
    struct LogicalLine final {
        std::size_t line_no{};
        std::string content{};
    };

    auto error_at(std::size_t line, std::string message) const noexcept -> Error {
        return Error{.kind = ErrorKind::Parse, .message = std::move(message), .path = m_file.path, .line = line};
    }

    auto next_physical_line() noexcept -> std::optional<std::string_view> {
        if (m_pos > m_text.size() || (m_pos == m_text.size() && (m_text.empty() || m_text.back() == '\n'))) {
            return std::nullopt;
        }
        auto end = m_text.find('\n', m_pos);
        if (end == std::string_view::npos) {
            end = m_text.size();
        }
        auto line = m_text.substr(m_pos, end - m_pos);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        m_pos = end + 1;
        ++m_line_no;
        return line;
    }

    // One line after joining backslash continuations.
    // Returns std::nullopt at end of input.
    auto next_logical_line() noexcept -> std::optional<std::expected<LogicalLine, Error>> {
        auto physical = next_physical_line();
        if (!physical) {
            return std::nullopt;
        }

        LogicalLine logical{.line_no = m_line_no, .content = std::string{*physical}};
        if (prodconf::utils::trim(logical.content).starts_with('#')) {
            return logical;
        }

        while (prodconf::utils::trim(logical.content).ends_with('\\')) {
            auto joined = std::string{prodconf::utils::trim(logical.content)};
            joined.pop_back();
            while (!joined.empty() && prodconf::utils::is_blank(joined.back())) {
                joined.pop_back();
            }
            // keep the indentation of the first physical line
            const auto indent = logical.content.find_first_not_of(" \t");
            logical.content   = logical.content.substr(0, indent) + joined;

            auto next = next_physical_line();
            if (!next || prodconf::utils::trim(*next).empty() || next->starts_with('[')) {
                return std::unexpected(error_at(logical.line_no, "unterminated multi-line value"));
            }
            logical.content += ' ';
            logical.content += prodconf::utils::trim(*next);
        }
        return logical;
    }

    auto process_line(std::size_t line_no, std::string_view content) noexcept -> std::expected<void, Error> {
        const auto trimmed = prodconf::utils::trim(content);
        if (trimmed.empty() || trimmed.starts_with('#')) {
            return {};
        }

        // continuation of the previous key
        if (prodconf::utils::is_blank(content.front())) {
            if (!m_pending) {
                return std::unexpected(error_at(line_no, fmt::format(FMT_COMPILE("continuation line '{}' without a key"), trimmed)));
            }
            m_pending->items.emplace_back(trimmed);
            return {};
        }

        if (auto result = flush_pending(); !result) {
            return result;
        }

        if (trimmed.starts_with('[')) {
            return open_section(line_no, trimmed);
        }

        if (!m_section_index) {
            return std::unexpected(error_at(line_no, fmt::format(FMT_COMPILE("key line '{}' outside of any section"), trimmed)));
        }

        const auto delim_pos = trimmed.find('=');
        if (delim_pos == std::string_view::npos) {
            return std::unexpected(error_at(line_no, fmt::format(FMT_COMPILE("expected 'key = value', got '{}'"), trimmed)));
        }
        const auto key = prodconf::utils::trim(trimmed.substr(0, delim_pos));
        if (key.empty()) {
            return std::unexpected(error_at(line_no, "empty key name"));
        }

        m_pending = PendingEntry{
            .key          = std::string{key},
            .inline_value = std::string{prodconf::utils::trim(trimmed.substr(delim_pos + 1))},
            .line         = line_no,
        };
        return {};
    }

    auto open_section(std::size_t line_no, std::string_view header) noexcept -> std::expected<void, Error> {
        if (!header.ends_with(']')) {
            return std::unexpected(error_at(line_no, fmt::format(FMT_COMPILE("malformed section header '{}'"), header)));
        }
        const auto name = prodconf::utils::trim(header.substr(1, header.size() - 2));
        if (name.empty() || name.find_first_of("[]"sv) != std::string_view::npos) {
            return std::unexpected(error_at(line_no, fmt::format(FMT_COMPILE("malformed section header '{}'"), header)));
        }

        // a repeated header reopens the section
        for (std::size_t i = 0; i < m_file.sections.size(); ++i) {
            if (m_file.sections[i].name == name) {
                m_section_index = i;
                return {};
            }
        }
        m_file.sections.emplace_back(prodconf::Section{.name = std::string{name}});
        m_section_index = m_file.sections.size() - 1;
        return {};
    }

    auto flush_pending() noexcept -> std::expected<void, Error> {
        if (!m_pending) {
            return {};
        }
        auto pending = std::move(*m_pending);
        m_pending.reset();

        auto& section = m_file.sections[*m_section_index];

        prodconf::Value value{};
        if (!pending.items.empty()) {
            prodconf::ValueList list{};
            if (!pending.inline_value.empty()) {
                list.emplace_back(std::move(pending.inline_value));
            }
            list.insert(list.end(), std::make_move_iterator(pending.items.begin()), std::make_move_iterator(pending.items.end()));
            value = std::move(list);
        } else if (prodconf::units::looks_like_quantity(pending.inline_value)) {
            auto quantity = prodconf::units::parse_quantity(pending.inline_value);
            if (!quantity) {
                auto error    = error_at(pending.line, std::move(quantity.error()));
                error.section = section.name;
                error.key     = pending.key;
                error.value   = pending.inline_value;
                return std::unexpected(std::move(error));
            }
            value = *quantity;
        } else {
            value = std::move(pending.inline_value);
        }

        prodconf::SourceLocation origin{.path = m_file.path, .line = pending.line};
        if (auto* existing = section.find(pending.key)) {
            if (!m_options.allow_duplicate_keys) {
                auto error    = error_at(pending.line, fmt::format(FMT_COMPILE("duplicate key '{}', first defined at line {}"), pending.key, existing->origin.line));
                error.section = section.name;
                error.key     = pending.key;
                return std::unexpected(std::move(error));
            }
            existing->value  = std::move(value);
            existing->origin = std::move(origin);
            return {};
        }
        section.entries.emplace_back(prodconf::Entry{.key = std::move(pending.key), .value = std::move(value), .origin = std::move(origin)});
        return {};
    }

    std::string_view m_text{};
    std::size_t m_pos{};
    std::size_t m_line_no{};
    const prodconf::ParseOptions& m_options;

    prodconf::ConfigFile m_file{};
    std::optional<std::size_t> m_section_index{};
    std::optional<PendingEntry> m_pending{};
};

}  // namespace

namespace prodconf {

auto parse_config_text(std::string_view text, std::string_view path, const ParseOptions& options) noexcept
    -> std::expected<ConfigFile, Error> {
    UnitParser parser{text, path, options};
    return parser.parse();
}

auto parse_config_file(std::string_view path, const ParseOptions& options) noexcept
    -> std::expected<ConfigFile, Error> {
    auto content = file_utils::read_whole_file(path);
    if (!content) {
        return std::unexpected(Error{.kind = ErrorKind::Io, .message = "failed to read configuration file", .path = std::string{path}});
    }

    auto config_file = parse_config_text(*content, path, options);
    if (!config_file) {
        spdlog::error("Failed to parse '{}': {}", path, config_file.error().describe());
        return config_file;
    }
    spdlog::debug("Parsed '{}': {} section(s)", path, config_file->sections.size());
    return config_file;
}

}  // namespace prodconf
