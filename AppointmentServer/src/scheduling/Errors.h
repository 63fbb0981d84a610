#pragma once

#include <string>
#include <type_traits>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace store { class StoreError; }

namespace scheduling {

enum class errc {
    validation_error = 1,
    not_found,
    forbidden,
    slot_unavailable,   // lost the race for a free slot; retry against fresh data
    slot_conflict,
    invalid_state,
    store_failure,
};

const boost::system::error_category& scheduling_category() noexcept;

inline boost::system::error_code make_error_code(errc e) noexcept {
    return boost::system::error_code(static_cast<int>(e), scheduling_category());
}

// Stable wire name for an error kind ("slot_conflict", ...). Foreign codes map to "internal".
const char* error_kind(const boost::system::error_code& ec);

// Thrown by the scheduling components; the enclosing transaction rolls back on unwind.
class SchedulingError : public boost::system::system_error {
public:
    SchedulingError(errc e, const std::string& what) : boost::system::system_error(make_error_code(e), what) {}
};

[[noreturn]] void fail(errc e, const std::string& what);

// Maps a store failure onto the scheduling taxonomy by SQLSTATE.
errc classify(const store::StoreError& e);

}

namespace boost { namespace system {
template<> struct is_error_code_enum<scheduling::errc> : std::true_type {};
} }
