#pragma once

#include <string>
#include <vector>
#include <boost/beast/http/status.hpp>
#include <boost/system/error_code.hpp>
#include "scheduling/SlotGenerator.h"
#include "scheduling/Types.h"

namespace api {

std::string slot_json(const scheduling::Slot& s);
std::string slots_json(const std::vector<scheduling::Slot>& slots);
std::string booking_json(const scheduling::Booking& b);
std::string bookings_json(const std::vector<scheduling::Booking>& bookings);
std::string generate_result_json(const scheduling::GenerateResult& r);
std::string shifted_slots_json(const std::vector<scheduling::Slot>& moved);

// {"error":"<kind>","message":"..."}
std::string error_json(const std::string& kind, const std::string& message);

boost::beast::http::status status_for(const boost::system::error_code& ec);

}
