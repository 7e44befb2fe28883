#include "network/dns_packet.hpp"

namespace lantern::network {
namespace {

constexpr int kHeaderSize = 12;
constexpr int kMaxPointerJumps = 32;

void put_u16(QByteArray& out, uint16_t value) {
    out.append(static_cast<char>(value >> 8));
    out.append(static_cast<char>(value & 0xFF));
}

class Reader {
public:
    explicit Reader(const QByteArray& data) : data_(data) {}

    [[nodiscard]] bool has(int count) const { return pos_ + count <= data_.size(); }
    [[nodiscard]] int pos() const { return pos_; }
    void seek(int pos) { pos_ = pos; }

    uint8_t u8_at(int pos) const { return static_cast<uint8_t>(data_[pos]); }

    uint16_t u16() {
        const uint16_t value = static_cast<uint16_t>((u8_at(pos_) << 8) | u8_at(pos_ + 1));
        pos_ += 2;
        return value;
    }

    /**
     * Read a possibly compressed name starting at the cursor; the cursor ends
     * after the name's in-place encoding.
     */
    Result<std::string, Error> name() {
        std::string out;
        int pos = pos_;
        int end_pos = -1;
        int jumps = 0;

        while (true) {
            if (pos >= data_.size()) {
                return Result<std::string, Error>::err(Error{"name runs past end of packet"});
            }
            const uint8_t len = u8_at(pos);

            if ((len & 0xC0) == 0xC0) {
                if (pos + 1 >= data_.size()) {
                    return Result<std::string, Error>::err(Error{"truncated name pointer"});
                }
                if (++jumps > kMaxPointerJumps) {
                    return Result<std::string, Error>::err(Error{"name pointer loop"});
                }
                if (end_pos < 0) end_pos = pos + 2;
                pos = ((len & 0x3F) << 8) | u8_at(pos + 1);
                continue;
            }
            if ((len & 0xC0) != 0) {
                return Result<std::string, Error>::err(Error{"unsupported label type"});
            }
            if (len == 0) {
                ++pos;
                break;
            }
            if (pos + 1 + len > data_.size()) {
                return Result<std::string, Error>::err(Error{"label runs past end of packet"});
            }
            if (!out.empty()) out += '.';
            out.append(data_.constData() + pos + 1, len);
            pos += 1 + len;
        }

        pos_ = end_pos >= 0 ? end_pos : pos;
        return Result<std::string, Error>::ok(std::move(out));
    }

private:
    const QByteArray& data_;
    int pos_ = 0;
};

} // namespace

Result<QByteArray, Error> encode_ptr_query(uint16_t id, std::string_view qname) {
    if (qname.size() > 253) {
        return Result<QByteArray, Error>::err(Error{"name too long"});
    }

    QByteArray out;
    put_u16(out, id);
    put_u16(out, 0);   // flags: standard query
    put_u16(out, 1);   // qdcount
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, 0);

    size_t start = 0;
    while (start < qname.size()) {
        auto dot = qname.find('.', start);
        if (dot == std::string_view::npos) dot = qname.size();
        const auto label = qname.substr(start, dot - start);
        if (label.empty() || label.size() > 63) {
            return Result<QByteArray, Error>::err(Error{"invalid label in " + std::string(qname)});
        }
        out.append(static_cast<char>(label.size()));
        out.append(label.data(), static_cast<qsizetype>(label.size()));
        start = dot + 1;
    }
    out.append('\0');

    put_u16(out, kDnsTypePtr);
    put_u16(out, kDnsClassIn);
    return Result<QByteArray, Error>::ok(std::move(out));
}

Result<std::vector<PtrRecord>, Error> parse_ptr_records(const QByteArray& packet) {
    Reader reader(packet);
    if (!reader.has(kHeaderSize)) {
        return Result<std::vector<PtrRecord>, Error>::err(Error{"packet shorter than header"});
    }

    reader.u16();   // id
    const uint16_t flags = reader.u16();
    const uint16_t qdcount = reader.u16();
    const uint16_t ancount = reader.u16();
    const uint16_t nscount = reader.u16();
    const uint16_t arcount = reader.u16();

    if ((flags & 0x8000) == 0) {
        return Result<std::vector<PtrRecord>, Error>::err(Error{"not a response"});
    }

    for (int i = 0; i < qdcount; ++i) {
        auto name = reader.name();
        if (name.is_err()) {
            return Result<std::vector<PtrRecord>, Error>::err(name.unwrap_err());
        }
        if (!reader.has(4)) {
            return Result<std::vector<PtrRecord>, Error>::err(Error{"truncated question"});
        }
        reader.seek(reader.pos() + 4);
    }

    std::vector<PtrRecord> records;
    const int record_count = ancount + nscount + arcount;
    for (int i = 0; i < record_count; ++i) {
        auto owner = reader.name();
        if (owner.is_err()) {
            return Result<std::vector<PtrRecord>, Error>::err(owner.unwrap_err());
        }
        if (!reader.has(10)) {
            return Result<std::vector<PtrRecord>, Error>::err(Error{"truncated record header"});
        }

        const uint16_t type = reader.u16();
        reader.u16();   // class (mDNS sets the cache-flush bit)
        reader.u16();   // ttl high
        reader.u16();   // ttl low
        const uint16_t rdlength = reader.u16();

        const int rdata_start = reader.pos();
        if (!reader.has(rdlength)) {
            return Result<std::vector<PtrRecord>, Error>::err(Error{"truncated record data"});
        }

        if (type == kDnsTypePtr) {
            auto target = reader.name();
            if (target.is_err()) {
                return Result<std::vector<PtrRecord>, Error>::err(target.unwrap_err());
            }
            records.push_back(PtrRecord{
                .owner = std::move(owner).unwrap(),
                .target = std::move(target).unwrap()
            });
        }
        reader.seek(rdata_start + rdlength);
    }

    return Result<std::vector<PtrRecord>, Error>::ok(std::move(records));
}

} // namespace lantern::network
