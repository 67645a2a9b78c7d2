#pragma once

#include <edge_agent/core/result.hpp>
#include <edge_agent/mcp/server_registry.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace edge_agent {

struct Table {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
};

// The `tools` table: built-in file tools first when local_file_tools is set,
// then every server tool. A row whose name is answered by someone else says
// so in the status column.
[[nodiscard]] Table ToolCatalogTable(const std::vector<CatalogEntry>& entries,
                                     bool local_file_tools);

// ---------------------------------------------------------------------------
// OutputFormatter — everything the CLI prints that is not model output.
//
// json_mode:  tables become arrays of objects, errors become {"error":{...}},
//             notices are dropped.
// color_mode: FTXUI box tables and ANSI-painted errors. Ignored in json_mode.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    void PrintTable(const Table& table) const;

    // To stderr.
    void PrintError(const Error& error) const;

    // "[Detected files: ...]" status line on stdout.
    void PrintNotice(const std::string& message) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace edge_agent
