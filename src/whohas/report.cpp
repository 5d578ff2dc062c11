#include "whohas/report.hpp"
#include "whohas/utils.hpp"

#include <algorithm> // For std::stable_sort, std::max
#include <fstream>
#include <map>
#include <sstream>
#include <utility>

namespace whohas {

const char* const EMPTY_REPORT_MESSAGE =
    "- No accepted ARP requests captured\n"
    "- If this is unexpected, check your whitelist/blacklist configuration";

namespace {

std::string flag_text(bool value) {
    return value ? "True" : "False";
}

std::string mac_text(const Host* host) {
    if (!host || !host->mac_address) {
        return "";
    }
    return host->mac_address->to_string();
}

// "name > forward address", or just the name when forward resolution failed.
std::string ptr_text(const Host* host) {
    if (!host || !host->ptr_hostname) {
        return "";
    }
    std::string text = *host->ptr_hostname;
    if (host->fwd_resolved_ip) {
        text += " > " + utils::ip_to_string(*host->fwd_resolved_ip);
    } else {
        text += " > [unresolved]";
    }
    return text;
}

std::string format_count(const RowContext& row) {
    return std::to_string(row.transaction.count);
}

std::string format_sender(const RowContext& row) {
    return row.new_sender ? utils::ip_to_string(row.transaction.sender_ip) : "";
}

std::string format_sender_mac(const RowContext& row) {
    return row.new_sender ? mac_text(row.sender) : "";
}

std::string format_target(const RowContext& row) {
    return utils::ip_to_string(row.transaction.target_ip);
}

std::string format_target_mac(const RowContext& row) {
    return mac_text(row.target);
}

std::string format_stale(const RowContext& row) {
    return flag_text(row.transaction.stale);
}

std::string format_sender_ptr(const RowContext& row) {
    return row.new_sender ? ptr_text(row.sender) : "";
}

std::string format_target_ptr(const RowContext& row) {
    return ptr_text(row.target);
}

std::string format_mitm_op(const RowContext& row) {
    return flag_text(row.transaction.mitm_op);
}

} // namespace

const std::vector<ColumnSpec>& column_specs() {
    static const std::vector<ColumnSpec> specs = {
        {Column::ARP_COUNT,  "arp_count",  "ARP#",                    &format_count,      true,  false},
        {Column::SENDER,     "sender",     "Sender",                  &format_sender,     false, false},
        {Column::SENDER_MAC, "sender_mac", "Sender MAC",              &format_sender_mac, false, false},
        {Column::TARGET,     "target",     "Target",                  &format_target,     false, false},
        {Column::TARGET_MAC, "target_mac", "Target MAC",              &format_target_mac, false, false},
        {Column::STALE,      "stale",      "Stale",                   &format_stale,      false, true},
        {Column::SENDER_PTR, "sender_ptr", "Sender PTR (PTR > FWD)",  &format_sender_ptr, false, false},
        {Column::TARGET_PTR, "target_ptr", "Target PTR (PTR > FWD)",  &format_target_ptr, false, false},
        {Column::MITM_OP,    "mitm_op",    "Target IP != Forward IP", &format_mitm_op,    false, true},
    };
    return specs;
}

const ColumnSpec& column_spec(Column column) {
    return column_specs().at(static_cast<std::size_t>(column));
}

std::optional<Column> parse_column(const std::string& name) {
    for (const auto& spec : column_specs()) {
        if (name == spec.name) {
            return spec.column;
        }
    }
    return std::nullopt;
}

std::vector<Column> default_columns() {
    return {Column::ARP_COUNT, Column::SENDER, Column::TARGET, Column::STALE,
            Column::SENDER_PTR, Column::TARGET_PTR, Column::MITM_OP};
}

std::optional<std::vector<Column>> parse_columns(const std::vector<std::string>& names, std::string* bad_name) {
    if (names.empty()) {
        if (bad_name) bad_name->clear();
        return std::nullopt;
    }
    std::vector<Column> columns;
    for (const auto& name : names) {
        auto column = parse_column(name);
        if (!column) {
            if (bad_name) *bad_name = name;
            return std::nullopt;
        }
        columns.push_back(*column);
    }
    return columns;
}

bool write_report_file(const std::string& path, const std::string& text, Logger* logger) {
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        if (logger) logger->error("Report", "Unable to open " + path + " for writing.");
        return false;
    }
    file << text << "\n";
    if (!file) {
        if (logger) logger->error("Report", "Failed writing " + path);
        return false;
    }
    return true;
}

ColorProfile ColorProfile::default_profile() {
    ColorProfile profile;
    profile.name = "default";
    profile.header = "\033[1;4m";   // Bold, underlined
    profile.odd_group = "\033[2m";  // Dim
    profile.even_group = "";
    profile.flag = "\033[1;31m";    // Bold red
    profile.reset = "\033[0m";
    return profile;
}

ColorProfile ColorProfile::disabled() {
    ColorProfile profile;
    profile.name = "disable";
    return profile;
}

std::optional<ColorProfile> ColorProfile::by_name(const std::string& name) {
    if (name == "default") return default_profile();
    if (name == "disable") return disabled();
    return std::nullopt;
}

ReportRenderer::ReportRenderer(std::vector<Column> columns, ColorProfile profile)
    : columns_(std::move(columns)), profile_(std::move(profile)) {}

std::string ReportRenderer::pad(const std::string& text, std::size_t width, bool right_align) const {
    if (text.size() >= width) {
        return text;
    }
    std::string fill(width - text.size(), ' ');
    return right_align ? fill + text : text + fill;
}

std::string ReportRenderer::render(const TransactionStore& store, const FilterLists* lists) const {
    std::vector<const Transaction*> ordered;
    for (const auto& pair : store.transactions()) {
        const Transaction& txn = pair.second;
        if (txn.count == 0) {
            continue;
        }
        if (lists && !lists->accepts(txn.sender_ip, txn.target_ip)) {
            continue;
        }
        ordered.push_back(&txn);
    }
    if (ordered.empty()) {
        return EMPTY_REPORT_MESSAGE;
    }

    std::stable_sort(ordered.begin(), ordered.end(), [](const Transaction* a, const Transaction* b) {
        return a->count > b->count;
    });

    // Group by sender, keeping the order in which senders first appear.
    std::vector<IpAddress> sender_order;
    std::map<IpAddress, std::vector<const Transaction*>, utils::IpOrder> groups;
    for (const Transaction* txn : ordered) {
        auto& group = groups[txn->sender_ip];
        if (group.empty()) {
            sender_order.push_back(txn->sender_ip);
        }
        group.push_back(txn);
    }

    struct Row {
        std::vector<std::string> cells;
        std::size_t group_index;
    };
    std::vector<Row> rows;
    for (std::size_t g = 0; g < sender_order.size(); ++g) {
        bool new_sender = true;
        for (const Transaction* txn : groups[sender_order[g]]) {
            RowContext context{*txn, store.host(txn->sender_ip), store.host(txn->target_ip), new_sender};
            Row row{{}, g};
            for (Column column : columns_) {
                row.cells.push_back(column_spec(column).format(context));
            }
            rows.push_back(std::move(row));
            new_sender = false;
        }
    }

    std::vector<std::size_t> widths;
    for (Column column : columns_) {
        widths.push_back(std::string(column_spec(column).header).size());
    }
    for (const auto& row : rows) {
        for (std::size_t c = 0; c < row.cells.size(); ++c) {
            widths[c] = std::max(widths[c], row.cells[c].size());
        }
    }

    const std::string& reset = profile_.reset;
    std::ostringstream out;

    for (std::size_t c = 0; c < columns_.size(); ++c) {
        const ColumnSpec& spec = column_spec(columns_[c]);
        if (c > 0) out << "  ";
        std::string cell = pad(spec.header, widths[c], spec.right_align);
        out << (profile_.enabled() ? profile_.header + cell + reset : cell);
    }
    out << "\n";
    for (std::size_t c = 0; c < columns_.size(); ++c) {
        if (c > 0) out << "  ";
        out << std::string(widths[c], '-');
    }

    for (const auto& row : rows) {
        out << "\n";
        // Alternate shading per sender group.
        const std::string& shade = (row.group_index % 2 == 0) ? profile_.odd_group : profile_.even_group;
        for (std::size_t c = 0; c < row.cells.size(); ++c) {
            const ColumnSpec& spec = column_spec(columns_[c]);
            if (c > 0) out << "  ";
            std::string cell = pad(row.cells[c], widths[c], spec.right_align);
            if (!profile_.enabled()) {
                out << cell;
            } else if (spec.is_flag && row.cells[c] == "True") {
                out << profile_.flag << cell << reset;
            } else if (!shade.empty()) {
                out << shade << cell << reset;
            } else {
                out << cell;
            }
        }
    }
    return out.str();
}

} // namespace whohas
