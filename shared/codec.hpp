// shared/codec.hpp
// Line framing plus record decode/encode for the comma-separated wire format
#ifndef SHARED_CODEC_HPP
#define SHARED_CODEC_HPP

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "protocol.hpp"

namespace Codec {

// Splits a byte stream into newline-terminated records. Bytes after the last
// newline stay buffered until more data arrives.
class LineDecoder {
public:
    explicit LineDecoder(std::size_t maxLineLength = DEFAULT_MAX_LINE_LENGTH)
        : maxLineLength_(maxLineLength) {}

    void feed(const char* data, std::size_t size) {
        buffer_.append(data, size);
    }

    void feed(const std::string& data) { feed(data.data(), data.size()); }

    // Next complete line without its terminator, or nullopt if none is buffered yet
    std::optional<std::string> next() {
        std::size_t nl = buffer_.find('\n', offset_);
        if (nl == std::string::npos) {
            if (buffer_.size() - offset_ > maxLineLength_) {
                std::string preview = buffer_.substr(offset_, 32);
                throw ProtocolError("unterminated record exceeds " + std::to_string(maxLineLength_) + " bytes",
                                    preview + "...");
            }
            compact();
            return std::nullopt;
        }

        std::string line = buffer_.substr(offset_, nl - offset_);
        offset_ = nl + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.size() > maxLineLength_) {
            throw ProtocolError("record exceeds " + std::to_string(maxLineLength_) + " bytes",
                                line.substr(0, 32) + "...");
        }
        return line;
    }

    std::size_t buffered() const { return buffer_.size() - offset_; }

private:
    void compact() {
        if (offset_ > 0) {
            buffer_.erase(0, offset_);
            offset_ = 0;
        }
    }

    std::string buffer_;
    std::size_t offset_ = 0;
    std::size_t maxLineLength_;
};

inline std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true) {
        std::size_t comma = line.find(',', start);
        if (comma == std::string::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, comma - start));
        start = comma + 1;
    }
    return fields;
}

inline int parseInt(const std::string& field, const std::string& line) {
    int value = 0;
    const char* first = field.data();
    const char* last = field.data() + field.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (field.empty() || ec != std::errc() || ptr != last) {
        throw ProtocolError("expected integer, got '" + field + "'", line);
    }
    return value;
}

inline uint64_t parseKey(const std::string& field, const std::string& line) {
    uint64_t value = 0;
    const char* last = field.data() + field.size();
    auto [ptr, ec] = std::from_chars(field.data(), last, value);
    if (field.empty() || ec != std::errc() || ptr != last) {
        throw ProtocolError("expected unsigned integer, got '" + field + "'", line);
    }
    return value;
}

inline double parseNumber(const std::string& field, const std::string& line) {
    if (field.empty()) {
        throw ProtocolError("expected number, got empty field", line);
    }
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(field.c_str(), &end);
    if (end != field.c_str() + field.size() || errno == ERANGE || !std::isfinite(value)) {
        throw ProtocolError("expected finite number, got '" + field + "'", line);
    }
    return value;
}

inline float parseFloat(const std::string& field, const std::string& line) {
    double value = parseNumber(field, line);
    float narrowed = static_cast<float>(value);
    if (!std::isfinite(narrowed)) {
        throw ProtocolError("number out of range '" + field + "'", line);
    }
    return narrowed;
}

inline void expectFields(const std::vector<std::string>& fields, std::size_t count, const std::string& line) {
    if (fields.size() != count) {
        throw ProtocolError("expected " + std::to_string(count) + " fields, got " +
                            std::to_string(fields.size()), line);
    }
}

// Text after the opcode and its comma, commas included
inline std::string remainder(const std::string& line) {
    return line.size() > 2 ? line.substr(2) : std::string();
}

// Shortest decimal form with at most three fractional digits
inline std::string formatNumber(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    std::string s(buf);
    std::size_t dot = s.find('.');
    if (dot != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

inline std::string opcodeOf(const std::string& line, const std::vector<std::string>& fields) {
    if (fields.empty() || fields[0].size() != 1) {
        throw ProtocolError("bad opcode", line);
    }
    return fields[0];
}

// Client → Server decode

inline ClientMessage decodeClientMessage(const std::string& line) {
    if (line.empty()) {
        throw ProtocolError("empty record", line);
    }
    std::vector<std::string> f = splitFields(line);
    std::string op = opcodeOf(line, f);

    switch (op[0]) {
        case Op::VERSION: {
            expectFields(f, 2, line);
            return ClientMsg::Version{parseInt(f[1], line)};
        }
        case Op::AUTHENTICATE: {
            if (f.size() != 2 && f.size() != 3) {
                throw ProtocolError("expected 2 or 3 fields, got " + std::to_string(f.size()), line);
            }
            return ClientMsg::Authenticate{f[1], f.size() == 3 ? f[2] : std::string()};
        }
        case Op::NICK: {
            expectFields(f, 2, line);
            return ClientMsg::Nick{f[1]};
        }
        case Op::CHUNK: {
            if (f.size() != 3 && f.size() != 4) {
                throw ProtocolError("expected 3 or 4 fields, got " + std::to_string(f.size()), line);
            }
            ClientMsg::ChunkRequest req;
            req.p = parseInt(f[1], line);
            req.q = parseInt(f[2], line);
            if (f.size() == 4) req.key = parseKey(f[3], line);
            return req;
        }
        case Op::BLOCK: {
            ClientMsg::BlockEdit edit;
            std::size_t i = 1;
            if (f.size() == 7) {
                edit.p = parseInt(f[1], line);
                edit.q = parseInt(f[2], line);
                i = 3;
            } else if (f.size() != 5) {
                throw ProtocolError("expected 5 or 7 fields, got " + std::to_string(f.size()), line);
            }
            edit.x = parseInt(f[i], line);
            edit.y = parseInt(f[i + 1], line);
            edit.z = parseInt(f[i + 2], line);
            edit.w = parseInt(f[i + 3], line);
            return edit;
        }
        case Op::POSITION: {
            expectFields(f, 6, line);
            ClientMsg::Position pos;
            pos.x = parseFloat(f[1], line);
            pos.y = parseFloat(f[2], line);
            pos.z = parseFloat(f[3], line);
            pos.rx = parseFloat(f[4], line);
            pos.ry = parseFloat(f[5], line);
            return pos;
        }
        case Op::TALK: {
            if (f.size() < 2) {
                throw ProtocolError("talk record without text", line);
            }
            return ClientMsg::Talk{remainder(line)};
        }
        case Op::DISCONNECT: {
            expectFields(f, 1, line);
            return ClientMsg::Disconnect{};
        }
        default:
            return ClientMsg::Unknown{op};
    }
}

// Server → Client decode (used by bots and tests)

inline ServerMessage decodeServerMessage(const std::string& line) {
    if (line.empty()) {
        throw ProtocolError("empty record", line);
    }
    std::vector<std::string> f = splitFields(line);
    std::string op = opcodeOf(line, f);

    switch (op[0]) {
        case Op::YOU: {
            expectFields(f, 7, line);
            return ServerMsg::You{parseInt(f[1], line), parseFloat(f[2], line), parseFloat(f[3], line),
                                  parseFloat(f[4], line), parseFloat(f[5], line), parseFloat(f[6], line)};
        }
        case Op::TIME: {
            expectFields(f, 3, line);
            return ServerMsg::Time{parseNumber(f[1], line), parseInt(f[2], line)};
        }
        case Op::BLOCK: {
            expectFields(f, 7, line);
            return ServerMsg::Block{parseInt(f[1], line), parseInt(f[2], line), parseInt(f[3], line),
                                    parseInt(f[4], line), parseInt(f[5], line), parseInt(f[6], line)};
        }
        case Op::KEY: {
            expectFields(f, 4, line);
            return ServerMsg::Key{parseInt(f[1], line), parseInt(f[2], line), parseKey(f[3], line)};
        }
        case Op::REDRAW: {
            expectFields(f, 3, line);
            return ServerMsg::Redraw{parseInt(f[1], line), parseInt(f[2], line)};
        }
        case Op::POSITION: {
            expectFields(f, 7, line);
            return ServerMsg::Position{parseInt(f[1], line), parseFloat(f[2], line), parseFloat(f[3], line),
                                       parseFloat(f[4], line), parseFloat(f[5], line), parseFloat(f[6], line)};
        }
        case Op::NICK: {
            expectFields(f, 3, line);
            return ServerMsg::Nick{parseInt(f[1], line), f[2]};
        }
        case Op::DISCONNECT: {
            expectFields(f, 2, line);
            return ServerMsg::Disconnect{parseInt(f[1], line)};
        }
        case Op::TALK: {
            if (f.size() < 2) {
                throw ProtocolError("talk record without text", line);
            }
            return ServerMsg::Talk{remainder(line)};
        }
        default:
            throw ProtocolError("unknown opcode '" + op + "'", line);
    }
}

// Encoding. Every record ends with '\n'.

inline std::string record(char op) {
    return std::string(1, op);
}

template<class... Fields>
inline std::string record(char op, const Fields&... fields) {
    std::string out(1, op);
    auto append = [&out](const auto& v) {
        out += ',';
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::string>) {
            out += v;
        } else if constexpr (std::is_floating_point_v<V>) {
            out += formatNumber(v);
        } else {
            out += std::to_string(v);
        }
    };
    (append(fields), ...);
    return out;
}

inline std::string encode(const ServerMsg::You& m) {
    return record(Op::YOU, m.id, m.x, m.y, m.z, m.rx, m.ry) + "\n";
}
inline std::string encode(const ServerMsg::Time& m) {
    return record(Op::TIME, m.time, m.dayLength) + "\n";
}
inline std::string encode(const ServerMsg::Block& m) {
    return record(Op::BLOCK, m.p, m.q, m.x, m.y, m.z, m.w) + "\n";
}
inline std::string encode(const ServerMsg::Key& m) {
    return record(Op::KEY, m.p, m.q, m.key) + "\n";
}
inline std::string encode(const ServerMsg::Redraw& m) {
    return record(Op::REDRAW, m.p, m.q) + "\n";
}
inline std::string encode(const ServerMsg::Position& m) {
    return record(Op::POSITION, m.id, m.x, m.y, m.z, m.rx, m.ry) + "\n";
}
inline std::string encode(const ServerMsg::Nick& m) {
    return record(Op::NICK, m.id, m.name) + "\n";
}
inline std::string encode(const ServerMsg::Disconnect& m) {
    return record(Op::DISCONNECT, m.id) + "\n";
}
inline std::string encode(const ServerMsg::Talk& m) {
    return record(Op::TALK, m.text) + "\n";
}

inline std::string encode(const ClientMsg::Version& m) {
    return record(Op::VERSION, m.version) + "\n";
}
inline std::string encode(const ClientMsg::Authenticate& m) {
    if (m.token.empty()) return record(Op::AUTHENTICATE, m.username) + "\n";
    return record(Op::AUTHENTICATE, m.username, m.token) + "\n";
}
inline std::string encode(const ClientMsg::Nick& m) {
    return record(Op::NICK, m.name) + "\n";
}
inline std::string encode(const ClientMsg::ChunkRequest& m) {
    return record(Op::CHUNK, m.p, m.q, m.key) + "\n";
}
inline std::string encode(const ClientMsg::BlockEdit& m) {
    if (m.p && m.q) return record(Op::BLOCK, *m.p, *m.q, m.x, m.y, m.z, m.w) + "\n";
    return record(Op::BLOCK, m.x, m.y, m.z, m.w) + "\n";
}
inline std::string encode(const ClientMsg::Position& m) {
    return record(Op::POSITION, m.x, m.y, m.z, m.rx, m.ry) + "\n";
}
inline std::string encode(const ClientMsg::Talk& m) {
    return record(Op::TALK, m.text) + "\n";
}
inline std::string encode(const ClientMsg::Disconnect&) {
    return record(Op::DISCONNECT) + "\n";
}
inline std::string encode(const ClientMsg::Unknown& m) {
    return m.opcode + "\n";
}

inline std::string encode(const ServerMessage& m) {
    return std::visit([](const auto& v) { return encode(v); }, m);
}

inline std::string encode(const ClientMessage& m) {
    return std::visit([](const auto& v) { return encode(v); }, m);
}

} // namespace Codec

#endif // SHARED_CODEC_HPP
