#include "gtest/gtest.h"
#include "whohas/dns_resolver.hpp"
#include "whohas/utils.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace {

// Assembles a DNS response: one question and the given answer records. Answer
// owner names point back at the question name.
class DnsResponseBuilder {
public:
    DnsResponseBuilder(const std::string& question, uint16_t qtype) : question_(question), qtype_(qtype) {}

    DnsResponseBuilder& answer(uint16_t type, const std::vector<uint8_t>& rdata) {
        answers_.push_back({type, rdata});
        return *this;
    }

    std::vector<uint8_t> build() const {
        std::vector<uint8_t> out;
        put16(out, 0x1234);                               // id
        put16(out, 0x8180);                               // response, recursion available
        put16(out, 1);                                    // qdcount
        put16(out, static_cast<uint16_t>(answers_.size())); // ancount
        put16(out, 0);                                    // nscount
        put16(out, 0);                                    // arcount
        std::vector<uint8_t> name = encode_name(question_);
        out.insert(out.end(), name.begin(), name.end());
        put16(out, qtype_);
        put16(out, 1); // IN
        for (const auto& record : answers_) {
            put16(out, 0xC00C); // pointer to the question name
            put16(out, record.type);
            put16(out, 1);
            put16(out, 0);
            put16(out, 300); // ttl
            put16(out, static_cast<uint16_t>(record.rdata.size()));
            out.insert(out.end(), record.rdata.begin(), record.rdata.end());
        }
        return out;
    }

    static std::vector<uint8_t> encode_name(const std::string& name) {
        std::vector<uint8_t> out;
        std::size_t start = 0;
        while (start < name.size()) {
            std::size_t dot = name.find('.', start);
            if (dot == std::string::npos) dot = name.size();
            out.push_back(static_cast<uint8_t>(dot - start));
            out.insert(out.end(), name.begin() + start, name.begin() + dot);
            start = dot + 1;
        }
        out.push_back(0);
        return out;
    }

private:
    struct Record {
        uint16_t type;
        std::vector<uint8_t> rdata;
    };

    std::string question_;
    uint16_t qtype_;
    std::vector<Record> answers_;

    static void put16(std::vector<uint8_t>& out, uint16_t value) {
        out.push_back(static_cast<uint8_t>(value >> 8));
        out.push_back(static_cast<uint8_t>(value & 0xFF));
    }
};

constexpr uint16_t TYPE_A = 1;
constexpr uint16_t TYPE_CNAME = 5;
constexpr uint16_t TYPE_PTR = 12;

int size_of(const std::vector<uint8_t>& bytes) {
    return static_cast<int>(bytes.size());
}

} // namespace

TEST(DnsNameResolverTest, ReverseNameReversesOctets) {
    EXPECT_EQ(whohas::DnsNameResolver::reverse_name(*whohas::utils::parse_ipv4("10.0.0.9")),
              "9.0.0.10.in-addr.arpa");
    EXPECT_EQ(whohas::DnsNameResolver::reverse_name(*whohas::utils::parse_ipv4("192.168.1.254")),
              "254.1.168.192.in-addr.arpa");
}

TEST(DnsAnswerTest, PtrRecordYieldsHostname) {
    auto response = DnsResponseBuilder("9.0.0.10.in-addr.arpa", TYPE_PTR)
                        .answer(TYPE_PTR, DnsResponseBuilder::encode_name("printer.local"))
                        .build();
    auto name = whohas::DnsNameResolver::parse_ptr_answer(response.data(), size_of(response));
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "printer.local");
}

TEST(DnsAnswerTest, ARecordYieldsAddress) {
    auto response = DnsResponseBuilder("printer.local", TYPE_A).answer(TYPE_A, {10, 0, 0, 50}).build();
    auto address = whohas::DnsNameResolver::parse_a_answer(response.data(), size_of(response));
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, *whohas::utils::parse_ipv4("10.0.0.50"));
}

TEST(DnsAnswerTest, CnameBeforeAddressIsSkipped) {
    auto response = DnsResponseBuilder("printer.local", TYPE_A)
                        .answer(TYPE_CNAME, DnsResponseBuilder::encode_name("print-01.corp.local"))
                        .answer(TYPE_A, {10, 0, 0, 9})
                        .build();
    auto address = whohas::DnsNameResolver::parse_a_answer(response.data(), size_of(response));
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(whohas::utils::ip_to_string(*address), "10.0.0.9");
    EXPECT_FALSE(whohas::DnsNameResolver::parse_ptr_answer(response.data(), size_of(response)).has_value());
}

TEST(DnsAnswerTest, EmptyOrMalformedAnswersYieldNothing) {
    auto empty_ptr = DnsResponseBuilder("9.0.0.10.in-addr.arpa", TYPE_PTR).build();
    EXPECT_FALSE(whohas::DnsNameResolver::parse_ptr_answer(empty_ptr.data(), size_of(empty_ptr)).has_value());

    auto empty_a = DnsResponseBuilder("printer.local", TYPE_A).build();
    EXPECT_FALSE(whohas::DnsNameResolver::parse_a_answer(empty_a.data(), size_of(empty_a)).has_value());

    // An A record must carry exactly four bytes.
    auto short_a = DnsResponseBuilder("printer.local", TYPE_A).answer(TYPE_A, {10, 0, 0}).build();
    EXPECT_FALSE(whohas::DnsNameResolver::parse_a_answer(short_a.data(), size_of(short_a)).has_value());

    auto truncated = DnsResponseBuilder("printer.local", TYPE_A).answer(TYPE_A, {10, 0, 0, 50}).build();
    truncated.resize(truncated.size() - 2);
    EXPECT_FALSE(whohas::DnsNameResolver::parse_a_answer(truncated.data(), size_of(truncated)).has_value());
    EXPECT_FALSE(whohas::DnsNameResolver::parse_a_answer(truncated.data(), 0).has_value());
}
