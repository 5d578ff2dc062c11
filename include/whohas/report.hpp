#ifndef WHOHAS_REPORT_HPP
#define WHOHAS_REPORT_HPP

#include "address_filter.hpp"    // For FilterLists
#include "logger.hpp"
#include "transaction_store.hpp" // For TransactionStore, Transaction, Host

#include <optional>
#include <string>
#include <vector>

namespace whohas {

enum class Column {
    ARP_COUNT,
    SENDER,
    SENDER_MAC,
    TARGET,
    TARGET_MAC,
    STALE,
    SENDER_PTR,
    TARGET_PTR,
    MITM_OP
};

// Everything a cell formatter may look at for one row.
struct RowContext {
    const Transaction& transaction;
    const Host* sender;
    const Host* target;
    bool new_sender; // First row of this sender's group
};

using CellFormatter = std::string (*)(const RowContext&);

struct ColumnSpec {
    Column column;
    const char* name;   // Command-line name
    const char* header;
    CellFormatter format;
    bool right_align;
    bool is_flag;       // "True" cells take the profile's flag color
};

// The full column table, in declaration order.
const std::vector<ColumnSpec>& column_specs();
const ColumnSpec& column_spec(Column column);

std::optional<Column> parse_column(const std::string& name);

// arp_count sender target stale sender_ptr target_ptr mitm_op
std::vector<Column> default_columns();

// Parses every name. Returns std::nullopt if the list is empty or any name is
// unknown; the offending name is stored in `bad_name`.
std::optional<std::vector<Column>> parse_columns(const std::vector<std::string>& names, std::string* bad_name = nullptr);

// ANSI escape sequences used when drawing the table. Empty strings draw plain text.
struct ColorProfile {
    std::string name;
    std::string header;
    std::string odd_group;
    std::string even_group;
    std::string flag;
    std::string reset;

    bool enabled() const { return !reset.empty(); }

    static ColorProfile default_profile();
    static ColorProfile disabled();
    // "default" or "disable".
    static std::optional<ColorProfile> by_name(const std::string& name);
};

extern const char* const EMPTY_REPORT_MESSAGE;

// Overwrites `path` with `text` and a trailing newline.
bool write_report_file(const std::string& path, const std::string& text, Logger* logger = nullptr);

class ReportRenderer {
public:
    explicit ReportRenderer(std::vector<Column> columns = default_columns(),
                            ColorProfile profile = ColorProfile::disabled());

    // Rows are ordered by request count (descending) and grouped by sender in
    // order of first appearance. Transactions rejected by `lists` are left out.
    std::string render(const TransactionStore& store, const FilterLists* lists = nullptr) const;

    const std::vector<Column>& columns() const { return columns_; }
    const ColorProfile& profile() const { return profile_; }

private:
    std::vector<Column> columns_;
    ColorProfile profile_;

    std::string pad(const std::string& text, std::size_t width, bool right_align) const;
};

} // namespace whohas

#endif // WHOHAS_REPORT_HPP
