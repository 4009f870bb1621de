#include <widgetcore/reactive/Link.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace WC::Detail {

auto report_link_reentrancy_limit(std::uint32_t depth) -> void {
    wc_log("Link change callback skipped at re-entrant depth " + std::to_string(depth), "Link", "WARNING");
    (void)depth;
}

} // namespace WC::Detail
