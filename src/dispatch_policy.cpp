#include "dispatch_policy.hpp"

DispatchAction WindowDispatchPolicy::decide(const BatteryState& /*state*/, double /*price*/, int minute_of_day,
                                            const Configuration& config) const {
    DispatchAction action;
    const auto& windows = config.windows();

    if (windows.charge_window.contains(minute_of_day)) {
        action.mode = DispatchMode::Charge;
    } else if (windows.discharge_window.contains(minute_of_day)) {
        action.mode = DispatchMode::Discharge;
    }

    action.pv_may_charge = action.mode == DispatchMode::Charge || config.pv().bidirectional_charging;
    return action;
}
