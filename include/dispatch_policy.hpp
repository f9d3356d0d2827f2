#ifndef DISPATCH_POLICY_H
#define DISPATCH_POLICY_H

#include "configuration.hpp"
#include "plant_model.hpp"

/// @brief What the battery does on the grid side in one interval.
enum class DispatchMode {
    Idle,
    Charge,
    Discharge
};

/**
 * @struct DispatchAction
 * @brief Decision for one interval.
 */
struct DispatchAction {
    DispatchMode mode = DispatchMode::Idle;
    bool pv_may_charge = false; ///< PV output may be stored this interval unless the battery discharges
};

/**
 * @class DispatchPolicy
 * @brief Decides the battery action for each interval.
 *
 * Implementations only decide; the engine enforces power, energy and SOC limits
 * and does all accounting, so a policy cannot violate physical constraints.
 * Implementations must be deterministic and free of mutable state, since one
 * policy may serve several concurrent runs.
 */
class DispatchPolicy {
public:
    virtual ~DispatchPolicy() = default;

    /**
     * @param state Battery state at the start of the interval.
     * @param price Clamped market price for the interval.
     * @param minute_of_day Start of the interval in minutes after midnight.
     * @param config The validated run configuration.
     */
    virtual DispatchAction decide(const BatteryState& state, double price, int minute_of_day,
                                  const Configuration& config) const = 0;
};

/**
 * @class WindowDispatchPolicy
 * @brief Charges inside the charge window and discharges inside the discharge window.
 *
 * PV may charge the battery inside the charge window, and in any interval
 * when bidirectional charging is enabled. The engine still keeps PV out of
 * a battery that is discharging in the same interval.
 */
class WindowDispatchPolicy : public DispatchPolicy {
public:
    DispatchAction decide(const BatteryState& state, double price, int minute_of_day,
                          const Configuration& config) const override;
};

#endif // DISPATCH_POLICY_H
