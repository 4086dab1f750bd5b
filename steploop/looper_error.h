#pragma once
#include <stdexcept>

namespace steploop {

    /**
     * Exception thrown when a looper, its queue or handlers are used incorrectly
     */
    class looper_error : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

} // namespace steploop
