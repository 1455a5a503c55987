#include "Message.h"
#include "../../Settings.h"
#include <cstring>
#include <stdexcept>

Message::Message(uint32_t msgId) : id(msgId)
{
    data.reserve(MESSAGE_INITIAL_VECTOR_SIZE);

    // Every frame starts with its id, reading starts after it
    push_uint(msgId);
    index = data.size();
}

Message::Message(const std::vector<uint8_t>& vdata) : data(vdata), id(0)
{
    id = pop_uint();
}

void Message::require(uint64_t count) const
{
    if (count > data.size() - index)
    {
        throw std::out_of_range(
                "Message " + std::to_string(id) + " truncated: wanted " + std::to_string(count) + " bytes at offset "
                + std::to_string(index) + " of " + std::to_string(data.size())
        );
    }
}

void Message::push_bool(bool value)
{
    push_ubyte(value ? 1 : 0);
}

auto Message::pop_bool() -> bool
{
    return pop_ubyte() == 1;
}

void Message::push_ubyte(uint8_t value)
{
    data.push_back(value);
}

auto Message::pop_ubyte() -> uint8_t
{
    require(1);
    return data[index++];
}

void Message::push_byte(int8_t value)
{
    push_ubyte(static_cast<uint8_t>(value));
}

auto Message::pop_byte() -> int8_t
{
    return static_cast<int8_t>(pop_ubyte());
}

// Fixed width primitives are written in host (little endian) byte order
#define add_type(name, type)                                            \
    void Message::push_##name(type value)                               \
    {                                                                   \
        uint8_t bytes[sizeof(type)];                                    \
        std::memcpy(bytes, &value, sizeof(type));                       \
        data.insert(data.end(), bytes, bytes + sizeof(type));           \
    }                                                                   \
                                                                        \
    auto Message::pop_##name() -> type                                  \
    {                                                                   \
        require(sizeof(type));                                          \
        type result;                                                    \
        std::memcpy(&result, &data[index], sizeof(type));               \
        index += sizeof(type);                                          \
        return result;                                                  \
    }

// NOLINTBEGIN(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
add_type(ushort, uint16_t)
add_type(short, int16_t)
add_type(uint, uint32_t)
add_type(int, int32_t)
add_type(ulong, uint64_t)
add_type(long, int64_t)
add_type(float, float)
add_type(double, double)
// NOLINTEND(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)

#undef add_type

void Message::push_string(const std::string& value)
{
    push_ulong(value.size());
    data.insert(data.end(), value.begin(), value.end());
}

auto Message::pop_string() -> std::string
{
    auto result = pop_bytes();
    return {result.begin(), result.end()};
}

void Message::push_bytes(const std::vector<uint8_t>& value)
{
    push_bytes(value.data(), value.size());
}

void Message::push_bytes(const uint8_t* value, uint64_t length)
{
    push_ulong(length);
    data.insert(data.end(), value, value + length);
}

auto Message::pop_bytes() -> std::vector<uint8_t>
{
    auto len = pop_ulong();
    require(len);

    auto begin = data.begin() + static_cast<std::ptrdiff_t>(index);
    auto result = std::vector<uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(len));
    index += len;
    return result;
}
