#include "vault/helpers.hpp"

namespace vault {
namespace helpers {

std::string root_hex(const EventBook& book) {
    if (!book.has_cover() || book.cover().root().empty()) return "";
    return to_hex(book.cover().root());
}

google::protobuf::Timestamp timestamp_at(int64_t seconds) {
    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds);
    ts.set_nanos(0);
    return ts;
}

} // namespace helpers
} // namespace vault
