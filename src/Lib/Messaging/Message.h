//
// Binary frame codec for the remote session protocol
//

#ifndef TELESTORE_RELAY_MESSAGE_H
#define TELESTORE_RELAY_MESSAGE_H

#include "../TestingMacros.h"
#include <cstdint>
#include <string>
#include <vector>

// Session lifecycle
#define SESSION_READY 1000
#define SESSION_ERROR 1001
#define SESSION_AUTHORIZE 1002
#define SESSION_CLOSE 1003

// Channel addressing
#define RESOLVE_CHANNEL 2000
#define CHANNEL_RESOLVED 2001

// Object upload
#define UPLOAD_BEGIN 3000
#define UPLOAD_READY 3001
#define UPLOAD_CHUNK 3002
#define UPLOAD_END 3003
#define UPLOAD_RESULT 3004

// Object download
#define OBJECT_INFO 4000
#define OBJECT_DETAILS 4001
#define OBJECT_NOT_FOUND 4002
#define OBJECT_READ 4003
#define OBJECT_CHUNK 4004

class Message {
public:
    explicit Message(uint32_t msgId);
    explicit Message(const std::vector<uint8_t>& vdata);

    void push_bool(bool value);
    void push_ubyte(uint8_t value);
    void push_byte(int8_t value);
    void push_ushort(uint16_t value);
    void push_short(int16_t value);
    void push_uint(uint32_t value);
    void push_int(int32_t value);
    void push_ulong(uint64_t value);
    void push_long(int64_t value);
    void push_float(float value);
    void push_double(double value);
    void push_string(const std::string& value);
    void push_bytes(const std::vector<uint8_t>& value);
    void push_bytes(const uint8_t* value, uint64_t length);

    auto pop_bool() -> bool;
    auto pop_ubyte() -> uint8_t;
    auto pop_byte() -> int8_t;
    auto pop_ushort() -> uint16_t;
    auto pop_short() -> int16_t;
    auto pop_uint() -> uint32_t;
    auto pop_int() -> int32_t;
    auto pop_ulong() -> uint64_t;
    auto pop_long() -> int64_t;
    auto pop_float() -> float;
    auto pop_double() -> double;
    auto pop_string() -> std::string;
    auto pop_bytes() -> std::vector<uint8_t>;

    [[nodiscard]] auto getId() const -> uint32_t { return id; }

    [[nodiscard]] auto getData() const -> const std::vector<uint8_t>& { return data; }

private:
    // Throws std::out_of_range if fewer than count bytes remain unread
    void require(uint64_t count) const;

    std::vector<uint8_t> data;
    uint64_t index = 0;
    uint32_t id;

EXPOSE_PROPERTY_FOR_TESTING_READONLY(index);
};

#endif //TELESTORE_RELAY_MESSAGE_H
