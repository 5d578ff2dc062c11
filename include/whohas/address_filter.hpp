#ifndef WHOHAS_ADDRESS_FILTER_HPP
#define WHOHAS_ADDRESS_FILTER_HPP

#include "packet.hpp" // For IpAddress
#include "logger.hpp" // For Logger
#include "utils.hpp"  // For IpOrder

#include <set>
#include <string>
#include <vector>
#include <cstddef>

namespace whohas {

enum class ListType {
    WHITE,
    BLACK
};

// Allow/deny list for one address role (sender or target).
// Invariant: white and black never share a value.
class AddressList {
public:
    using AddressSet = std::set<IpAddress, utils::IpOrder>;

    explicit AddressList(Logger* logger = nullptr) : logger_(logger) {}

    void set_logger(Logger* logger) { logger_ = logger; }

    // `value` is a dotted-quad literal or the path of a file holding one address per line.
    // Returns false (after a warning) when it is neither.
    bool add(ListType list, const std::string& value);
    bool add_white(const std::string& value) { return add(ListType::WHITE, value); }
    bool add_black(const std::string& value) { return add(ListType::BLACK, value); }

    // Adds every value, then enforces the exclusion invariant once. Returns the number rejected.
    std::size_t add_all(ListType list, const std::vector<std::string>& values);

    void add_address(ListType list, IpAddress ip);
    void add_addresses(ListType list, const std::vector<IpAddress>& ips);

    // Expands one argument value into addresses. Sets `ok` to false when the value
    // is neither an address nor an existing file.
    static std::vector<IpAddress> expand_value(const std::string& value, Logger* logger, bool& ok);

    // Re-applies the exclusion invariant. Every mutator already ends with it.
    void finalize() { enforce_exclusion(); }

    bool check(IpAddress ip) const;

    const AddressSet& white() const { return white_; }
    const AddressSet& black() const { return black_; }
    bool empty() const { return white_.empty() && black_.empty(); }

private:
    AddressSet white_;
    AddressSet black_;
    Logger* logger_;

    AddressSet& select(ListType list) { return list == ListType::WHITE ? white_ : black_; }
    bool insert_value(ListType list, const std::string& value);
    static std::vector<IpAddress> read_address_file(const std::string& path, Logger* logger);
    void enforce_exclusion();
};

// The two independent list instances consulted for every request.
struct FilterLists {
    AddressList sender;
    AddressList target;

    explicit FilterLists(Logger* logger = nullptr) : sender(logger), target(logger) {}

    void set_logger(Logger* logger) {
        sender.set_logger(logger);
        target.set_logger(logger);
    }

    // Global lists apply to both roles. Returns the number of rejected values.
    std::size_t add_global(ListType list, const std::vector<std::string>& values, Logger* logger = nullptr) {
        std::size_t rejected = 0;
        std::vector<IpAddress> expanded;
        for (const auto& value : values) {
            bool ok = true;
            auto ips = AddressList::expand_value(value, logger, ok);
            if (!ok) ++rejected;
            expanded.insert(expanded.end(), ips.begin(), ips.end());
        }
        sender.add_addresses(list, expanded);
        target.add_addresses(list, expanded);
        return rejected;
    }

    bool accepts(IpAddress sender_ip, IpAddress target_ip) const {
        return sender.check(sender_ip) && target.check(target_ip);
    }
};

} // namespace whohas

#endif // WHOHAS_ADDRESS_FILTER_HPP
