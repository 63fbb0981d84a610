#include "Errors.h"
#include "store/SlotStore.h"

namespace scheduling {

namespace {

class SchedulingCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "scheduling"; }
    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::validation_error: return "invalid scheduling request";
            case errc::not_found: return "slot or appointment not found";
            case errc::forbidden: return "caller may not perform this operation";
            case errc::slot_unavailable: return "slot is no longer free";
            case errc::slot_conflict: return "slot overlaps another slot";
            case errc::invalid_state: return "operation not permitted in current state";
            case errc::store_failure: return "slot store failure";
        }
        return "unknown scheduling error";
    }
};

}

const boost::system::error_category& scheduling_category() noexcept {
    static const SchedulingCategory cat;
    return cat;
}

const char* error_kind(const boost::system::error_code& ec) {
    if (ec.category() != scheduling_category()) return "internal";
    switch (static_cast<errc>(ec.value())) {
        case errc::validation_error: return "validation_error";
        case errc::not_found: return "not_found";
        case errc::forbidden: return "forbidden";
        case errc::slot_unavailable: return "slot_unavailable";
        case errc::slot_conflict: return "slot_conflict";
        case errc::invalid_state: return "invalid_state";
        case errc::store_failure: return "store_failure";
    }
    return "internal";
}

void fail(errc e, const std::string& what) {
    throw SchedulingError(e, what);
}

errc classify(const store::StoreError& e) {
    const std::string& st = e.sqlstate();
    if (st == "23P01") return errc::slot_conflict;
    if (st == "23505" || st == "40001" || st == "40P01") return errc::slot_unavailable;
    return errc::store_failure;
}

}
