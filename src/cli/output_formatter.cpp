#include <edge_agent/cli/output_formatter.hpp>
#include <edge_agent/core/ansi.hpp>
#include <edge_agent/mcp/tool_samples.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <nlohmann/json.hpp>

namespace edge_agent {

namespace {

using namespace edge_agent::ansi;

// Tool descriptions come from servers and may hold invalid UTF-8.
void WriteJsonRows(std::ostream& out, const Table& table) {
    auto objects = nlohmann::json::array();
    for (const auto& row : table.rows) {
        auto object = nlohmann::json::object();
        const auto columns = std::min(table.headers.size(), row.size());
        for (size_t c = 0; c < columns; ++c) {
            object[table.headers[c]] = row[c];
        }
        objects.push_back(std::move(object));
    }
    out << objects.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

void WriteBoxed(std::ostream& out, const Table& table) {
    std::vector<std::vector<std::string>> cells{table.headers};
    cells.insert(cells.end(), table.rows.begin(), table.rows.end());

    auto box = ftxui::Table(std::move(cells));
    auto header = box.SelectRow(0);
    header.Decorate(ftxui::bold);
    header.SeparatorVertical(ftxui::LIGHT);
    header.BorderBottom(ftxui::LIGHT);

    auto document = box.Render();
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(document));
    ftxui::Render(screen, document);
    out << screen.ToString() << "\n";
}

// Two spaces between columns, a dashed rule under the header, last column
// unpadded.
void WriteAligned(std::ostream& out, const Table& table) {
    const auto columns = table.headers.size();
    std::vector<size_t> widths;
    for (const auto& header : table.headers) {
        widths.push_back(header.size());
    }
    for (const auto& row : table.rows) {
        for (size_t c = 0; c < columns && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto line = [&](const std::vector<std::string>& cells) {
        for (size_t c = 0; c < columns && c < cells.size(); ++c) {
            if (c > 0) {
                out << "  ";
            }
            const bool last = c + 1 == columns;
            out << std::left << std::setw(last ? 0 : static_cast<int>(widths[c])) << cells[c];
        }
        out << "\n";
    };

    line(table.headers);
    std::vector<std::string> rule;
    for (auto width : widths) {
        rule.emplace_back(width, '-');
    }
    line(rule);
    for (const auto& row : table.rows) {
        line(row);
    }
}

} // anonymous namespace

Table ToolCatalogTable(const std::vector<CatalogEntry>& entries, bool local_file_tools) {
    constexpr const char* kLocal = "(local)";
    Table table{{"tool", "server", "description", "status"}, {}};
    std::vector<std::string> local_names;
    if (local_file_tools) {
        for (const auto& tool : BuiltinFileTools()) {
            local_names.push_back(tool.name);
            table.rows.push_back({tool.name, kLocal, tool.description.value_or(""), ""});
        }
    }
    for (const auto& entry : entries) {
        std::string status;
        if (std::find(local_names.begin(), local_names.end(), entry.tool.name) !=
            local_names.end()) {
            status = std::string("shadowed by ") + kLocal;
        } else if (entry.shadowed_by) {
            status = "shadowed by " + *entry.shadowed_by;
        }
        table.rows.push_back({entry.tool.name, entry.server,
                              entry.tool.description.value_or(""), std::move(status)});
    }
    return table;
}

void OutputFormatter::PrintTable(const Table& table) const {
    if (json_mode_) {
        WriteJsonRows(out_, table);
    } else if (color_mode_) {
        WriteBoxed(out_, table);
    } else {
        WriteAligned(out_, table);
    }
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    // Error: <operation> [target]
    //   <message>
    //   Detail: <detail>
    err_ << Paint("Error: ", kRed, color_mode_) << Paint(error.operation, kBold, color_mode_);
    if (!error.target.empty()) {
        err_ << Paint(" [" + error.target + "]", kDim, color_mode_);
    }
    err_ << "\n  " << error.message << "\n";
    if (error.detail && !error.detail->empty()) {
        err_ << "  " << Paint("Detail: ", kDim, color_mode_) << *error.detail << "\n";
    }
}

void OutputFormatter::PrintNotice(const std::string& message) const {
    if (!json_mode_) {
        out_ << Paint("[" + message + "]", kDim, color_mode_) << "\n";
    }
}

} // namespace edge_agent
