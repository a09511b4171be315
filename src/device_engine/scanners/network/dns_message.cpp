#include "dns_message.h"

#include <algorithm>
#include <cstdio>

namespace capturehub {
namespace devices {
namespace scanners {

namespace {

constexpr size_t kHeaderSize = 12;
constexpr int kMaxCompressionJumps = 32;

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t read_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void write_u16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xff));
}

void write_name(std::vector<uint8_t>& out, const std::string& name) {
    size_t start = 0;
    while (start < name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) {
            dot = name.size();
        }
        const size_t label_len = std::min<size_t>(dot - start, 63);
        if (label_len > 0) {
            out.push_back(static_cast<uint8_t>(label_len));
            out.insert(out.end(), name.begin() + static_cast<long>(start),
                       name.begin() + static_cast<long>(start + label_len));
        }
        start = dot + 1;
    }
    out.push_back(0);
}

// Reads a possibly compressed name at `offset`; advances `offset` past it in the record.
bool read_name(const uint8_t* data, size_t length, size_t& offset, std::string& name) {
    name.clear();
    size_t pos = offset;
    bool jumped = false;
    int jumps = 0;
    while (true) {
        if (pos >= length) {
            return false;
        }
        const uint8_t len = data[pos];
        if ((len & 0xC0) == 0xC0) {
            if (pos + 1 >= length || ++jumps > kMaxCompressionJumps) {
                return false;
            }
            const size_t pointer = static_cast<size_t>(((len & 0x3F) << 8) | data[pos + 1]);
            if (!jumped) {
                offset = pos + 2;
            }
            jumped = true;
            pos = pointer;
            continue;
        }
        if (len == 0) {
            if (!jumped) {
                offset = pos + 1;
            }
            return true;
        }
        if ((len & 0xC0) != 0 || pos + 1 + len > length) {
            return false;
        }
        if (!name.empty()) {
            name.push_back('.');
        }
        name.append(reinterpret_cast<const char*>(data + pos + 1), len);
        pos += 1 + len;
    }
}

} // namespace

std::vector<uint8_t> build_ptr_query(const std::vector<std::string>& service_names, bool unicast_response) {
    std::vector<uint8_t> packet;
    write_u16(packet, 0);   // id
    write_u16(packet, 0);   // flags: standard query
    write_u16(packet, static_cast<uint16_t>(service_names.size()));
    write_u16(packet, 0);
    write_u16(packet, 0);
    write_u16(packet, 0);
    for (const auto& service : service_names) {
        write_name(packet, service);
        write_u16(packet, kDnsTypePtr);
        write_u16(packet, static_cast<uint16_t>(kDnsClassIn | (unicast_response ? kDnsClassUnicastResponse : 0)));
    }
    return packet;
}

bool parse_dns_response(const uint8_t* data, size_t length, std::vector<DnsRecord>& records) {
    if (!data || length < kHeaderSize) {
        return false;
    }
    const uint16_t flags = read_u16(data + 2);
    if ((flags & 0x8000) == 0) {
        return false;
    }
    const uint16_t qdcount = read_u16(data + 4);
    const size_t rr_count = static_cast<size_t>(read_u16(data + 6)) + read_u16(data + 8) + read_u16(data + 10);

    size_t offset = kHeaderSize;
    std::string name;
    for (uint16_t i = 0; i < qdcount; ++i) {
        if (!read_name(data, length, offset, name) || offset + 4 > length) {
            return true;
        }
        offset += 4;
    }

    for (size_t i = 0; i < rr_count; ++i) {
        DnsRecord record;
        if (!read_name(data, length, offset, record.name) || offset + 10 > length) {
            break;
        }
        record.type = read_u16(data + offset);
        record.rclass = static_cast<uint16_t>(read_u16(data + offset + 2) & 0x7FFF);
        record.ttl = read_u32(data + offset + 4);
        const uint16_t rdlength = read_u16(data + offset + 8);
        offset += 10;
        if (offset + rdlength > length) {
            break;
        }
        const size_t rdata = offset;
        offset += rdlength;

        switch (record.type) {
            case kDnsTypePtr: {
                size_t cursor = rdata;
                if (!read_name(data, length, cursor, record.target)) {
                    continue;
                }
                break;
            }
            case kDnsTypeSrv: {
                if (rdlength < 7) {
                    continue;
                }
                record.port = read_u16(data + rdata + 4);
                size_t cursor = rdata + 6;
                if (!read_name(data, length, cursor, record.target)) {
                    continue;
                }
                break;
            }
            case kDnsTypeA: {
                if (rdlength != 4) {
                    continue;
                }
                char buffer[16];
                std::snprintf(buffer, sizeof(buffer), "%u.%u.%u.%u",
                              static_cast<unsigned>(data[rdata]), static_cast<unsigned>(data[rdata + 1]),
                              static_cast<unsigned>(data[rdata + 2]), static_cast<unsigned>(data[rdata + 3]));
                record.address = buffer;
                break;
            }
            case kDnsTypeTxt: {
                size_t cursor = rdata;
                while (cursor < rdata + rdlength) {
                    const uint8_t len = data[cursor];
                    if (cursor + 1 + len > rdata + rdlength) {
                        break;
                    }
                    if (len > 0) {
                        record.txt.emplace_back(reinterpret_cast<const char*>(data + cursor + 1), len);
                    }
                    cursor += 1 + len;
                }
                break;
            }
            default:
                continue;
        }
        records.push_back(std::move(record));
    }
    return true;
}

} // namespace scanners
} // namespace devices
} // namespace capturehub
