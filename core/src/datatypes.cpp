#include "datatypes.hpp"
#include <stdexcept>

namespace core {

    std::string toString(SignalAction action) {
        switch (action) {
            case SignalAction::Hold:       return "hold";
            case SignalAction::EnterLong:  return "enter_long";
            case SignalAction::EnterShort: return "enter_short";
            case SignalAction::Exit:       return "exit";
        }
        return "unknown";
    }

    std::string toString(PositionSide side) {
        switch (side) {
            case PositionSide::Flat:  return "flat";
            case PositionSide::Long:  return "long";
            case PositionSide::Short: return "short";
        }
        return "unknown";
    }

    std::string toString(ExitReason reason) {
        switch (reason) {
            case ExitReason::Signal:     return "signal";
            case ExitReason::StopLoss:   return "stop_loss";
            case ExitReason::TakeProfit: return "take_profit";
            case ExitReason::EndOfData:  return "end_of_data";
        }
        return "unknown";
    }

    ExitReason exitReasonFromString(const std::string& value) {
        if (value == "signal") return ExitReason::Signal;
        if (value == "stop_loss") return ExitReason::StopLoss;
        if (value == "take_profit") return ExitReason::TakeProfit;
        if (value == "end_of_data") return ExitReason::EndOfData;
        throw std::invalid_argument("Unknown exit reason string: " + value);
    }

} // namespace core
