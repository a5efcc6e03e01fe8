// shared/protocol.hpp
// Network protocol opcodes and typed records
#ifndef SHARED_PROTOCOL_HPP
#define SHARED_PROTOCOL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

// Protocol version - increment when changing protocol
constexpr int PROTOCOL_VERSION = 1;

// Name constraints
constexpr std::size_t MAX_USERNAME_LENGTH = 32;

// Record opcodes (first field of every line)
namespace Op {
    constexpr char AUTHENTICATE = 'A';
    constexpr char BLOCK = 'B';
    constexpr char CHUNK = 'C';
    constexpr char DISCONNECT = 'D';
    constexpr char TIME = 'E';
    constexpr char KEY = 'K';
    constexpr char LIGHT = 'L';
    constexpr char NICK = 'N';
    constexpr char POSITION = 'P';
    constexpr char REDRAW = 'R';
    constexpr char SIGN = 'S';
    constexpr char TALK = 'T';
    constexpr char YOU = 'U';
    constexpr char VERSION = 'V';
}

// Client → Server records
namespace ClientMsg {
    struct Version { int version = PROTOCOL_VERSION; };
    struct Authenticate { std::string username; std::string token; };
    struct Nick { std::string name; };
    struct ChunkRequest { int p = 0, q = 0; uint64_t key = 0; };
    // The chunk fields are optional on the wire; the server derives them from x and z
    struct BlockEdit { std::optional<int> p, q; int x = 0, y = 0, z = 0, w = 0; };
    struct Position { float x = 0, y = 0, z = 0, rx = 0, ry = 0; };
    struct Talk { std::string text; };
    struct Disconnect {};
    struct Unknown { std::string opcode; };
}

using ClientMessage = std::variant<
    ClientMsg::Version,
    ClientMsg::Authenticate,
    ClientMsg::Nick,
    ClientMsg::ChunkRequest,
    ClientMsg::BlockEdit,
    ClientMsg::Position,
    ClientMsg::Talk,
    ClientMsg::Disconnect,
    ClientMsg::Unknown>;

// Server → Client records
namespace ServerMsg {
    struct You { int id = 0; float x = 0, y = 0, z = 0, rx = 0, ry = 0; };
    struct Time { double time = 0; int dayLength = 0; };
    struct Block { int p = 0, q = 0, x = 0, y = 0, z = 0, w = 0; };
    struct Key { int p = 0, q = 0; uint64_t key = 0; };
    struct Redraw { int p = 0, q = 0; };
    struct Position { int id = 0; float x = 0, y = 0, z = 0, rx = 0, ry = 0; };
    struct Nick { int id = 0; std::string name; };
    struct Disconnect { int id = 0; };
    struct Talk { std::string text; };
}

using ServerMessage = std::variant<
    ServerMsg::You,
    ServerMsg::Time,
    ServerMsg::Block,
    ServerMsg::Key,
    ServerMsg::Redraw,
    ServerMsg::Position,
    ServerMsg::Nick,
    ServerMsg::Disconnect,
    ServerMsg::Talk>;

#endif // SHARED_PROTOCOL_HPP
