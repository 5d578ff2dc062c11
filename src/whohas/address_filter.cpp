#include "whohas/address_filter.hpp"

#include <fstream>
#include <algorithm>
#include <iterator>

namespace whohas {

bool AddressList::add(ListType list, const std::string& value) {
    bool accepted = insert_value(list, value);
    enforce_exclusion();
    return accepted;
}

std::size_t AddressList::add_all(ListType list, const std::vector<std::string>& values) {
    std::size_t rejected = 0;
    for (const auto& value : values) {
        if (!insert_value(list, value)) {
            ++rejected;
        }
    }
    enforce_exclusion();
    return rejected;
}

void AddressList::add_address(ListType list, IpAddress ip) {
    select(list).insert(ip);
    enforce_exclusion();
}

void AddressList::add_addresses(ListType list, const std::vector<IpAddress>& ips) {
    select(list).insert(ips.begin(), ips.end());
    enforce_exclusion();
}

bool AddressList::check(IpAddress ip) const {
    if (!white_.empty()) {
        return white_.count(ip) > 0;
    }
    if (!black_.empty()) {
        return black_.count(ip) == 0;
    }
    return true;
}

std::vector<IpAddress> AddressList::expand_value(const std::string& value, Logger* logger, bool& ok) {
    ok = true;
    std::string trimmed = utils::trim(value);
    if (auto ip = utils::parse_ipv4(trimmed)) {
        return {*ip};
    }

    if (utils::file_exists(trimmed)) {
        auto ips = read_address_file(trimmed, logger);
        if (logger) {
            logger->debug("Filter", "Loaded " + std::to_string(ips.size()) + " address(es) from " + trimmed);
        }
        return ips;
    }

    if (logger) {
        logger->warning("Filter", "Invalid ipv4 address and unknown file, skipping: " + value);
    }
    ok = false;
    return {};
}

bool AddressList::insert_value(ListType list, const std::string& value) {
    bool ok = true;
    auto ips = expand_value(value, logger_, ok);
    select(list).insert(ips.begin(), ips.end());
    return ok;
}

// Lines that are not addresses are skipped without comment.
std::vector<IpAddress> AddressList::read_address_file(const std::string& path, Logger* logger) {
    std::vector<IpAddress> ips;
    std::ifstream file(path);
    if (!file.is_open()) {
        if (logger) {
            logger->warning("Filter", "Unable to read address file, skipping: " + path);
        }
        return ips;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (auto ip = utils::parse_ipv4(utils::trim(line))) {
            ips.push_back(*ip);
        }
    }
    return ips;
}

// A value named by both lists is dropped from both.
void AddressList::enforce_exclusion() {
    std::vector<IpAddress> common;
    std::set_intersection(white_.begin(), white_.end(), black_.begin(), black_.end(),
                          std::back_inserter(common), utils::IpOrder());
    for (IpAddress ip : common) {
        white_.erase(ip);
        black_.erase(ip);
        if (logger_) {
            logger_->warning("Filter", "Address " + utils::ip_to_string(ip) +
                                       " present in both whitelist and blacklist, removed from both");
        }
    }
}

} // namespace whohas
