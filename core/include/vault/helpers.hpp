#pragma once

#include <cstdint>
#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "vault/keys.hpp"
#include "vault/types.pb.h"

namespace vault {

/**
 * Helper functions for working with event books and packed messages.
 */
namespace helpers {

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/**
 * Get the domain from an EventBook.
 */
inline std::string domain(const EventBook& book) {
    return book.has_cover() ? book.cover().domain() : "";
}

/**
 * Get the correlation ID from an EventBook.
 */
inline std::string correlation_id(const EventBook& book) {
    return book.has_cover() ? book.cover().correlation_id() : "";
}

/**
 * Get the account address of an EventBook as hex, or "" if unset.
 */
std::string root_hex(const EventBook& book);

/**
 * Calculate the next sequence number from an EventBook.
 */
inline uint32_t next_sequence(const EventBook& book) {
    return static_cast<uint32_t>(book.pages_size());
}

/**
 * Extract the type name from a type URL.
 */
inline std::string type_name_from_url(const std::string& type_url) {
    auto pos = type_url.rfind('/');
    return pos != std::string::npos ? type_url.substr(pos + 1) : type_url;
}

/**
 * Check if a type URL matches the given fully qualified type name.
 */
inline bool type_url_matches(const std::string& type_url, const std::string& type_name) {
    return type_url == std::string(TYPE_URL_PREFIX) + type_name;
}

/**
 * Timestamp for unix seconds.
 */
google::protobuf::Timestamp timestamp_at(int64_t seconds);

/**
 * Pack a protobuf message into an Any.
 */
template<typename T>
google::protobuf::Any pack_any(const T& message) {
    google::protobuf::Any any;
    any.PackFrom(message, TYPE_URL_PREFIX);
    return any;
}

/**
 * Pack an event into an EventPage.
 */
template<typename T>
EventPage pack_event(const T& event_message) {
    EventPage page;
    page.mutable_event()->PackFrom(event_message, TYPE_URL_PREFIX);
    return page;
}

/**
 * Create a new EventBook for an account with the given events.
 */
template<typename... Events>
EventBook new_event_book(const std::string& domain, const Address& root, const Events&... events) {
    EventBook book;
    book.mutable_cover()->set_domain(domain);
    book.mutable_cover()->set_root(to_bytes(root));
    uint32_t sequence = 0;
    ((book.add_pages()->CopyFrom(pack_event(events)),
      book.mutable_pages(book.pages_size() - 1)->set_sequence(sequence++)), ...);
    return book;
}

} // namespace helpers
} // namespace vault
