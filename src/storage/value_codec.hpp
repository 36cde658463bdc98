#pragma once

#include <string>
#include <string_view>
#include <type_traits>

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message_lite.h>

namespace chandb {

// ── ValueCodec ───────────────────────────────────────────────────────────────
//
// Canonical byte encoding of a store value type. The same encoding is used
// for the snapshot file and as the input to the content hash, so it must be
// deterministic: two values with equal contents encode to equal bytes.
//
// A specialization provides:
//   static std::string type_name();                     // recorded in snapshots
//   static bool encode(const V& value, std::string& out);
//   static bool decode(std::string_view bytes, V& value);

template <typename V, typename Enable = void>
struct ValueCodec;

// Protobuf messages: deterministic serialization (fields in field-number
// order, map entries sorted by key).
template <typename V>
struct ValueCodec<V, std::enable_if_t<
    std::is_base_of_v<google::protobuf::MessageLite, V>>> {

    static std::string type_name() {
        return V::default_instance().GetTypeName();
    }

    static bool encode(const V& value, std::string& out) {
        out.clear();
        {
            google::protobuf::io::StringOutputStream raw(&out);
            google::protobuf::io::CodedOutputStream coded(&raw);
            coded.SetSerializationDeterministic(true);
            if (!value.SerializeToCodedStream(&coded)) {
                return false;
            }
            if (coded.HadError()) {
                return false;
            }
        } // CodedOutputStream flushes into `out` on destruction
        return true;
    }

    static bool decode(std::string_view bytes, V& value) {
        return value.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()));
    }
};

// Raw strings are stored as-is.
template <>
struct ValueCodec<std::string> {
    static std::string type_name() { return "string"; }

    static bool encode(const std::string& value, std::string& out) {
        out = value;
        return true;
    }

    static bool decode(std::string_view bytes, std::string& value) {
        value.assign(bytes.data(), bytes.size());
        return true;
    }
};

} // namespace chandb
