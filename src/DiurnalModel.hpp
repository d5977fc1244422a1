#pragma once

#include "SunCalc.hpp"
#include <cstdint>
#include <vector>

// Idealized daily temperature course: sine between sunrise and sunset,
// logarithmic decay through the night (Linvill 1990, Spencer daylength).
namespace NDiurnal {

    enum eExtremeSlot : std::uint8_t {
        SLOT_TMIN_PREV = 0,
        SLOT_TMAX_PREV,
        SLOT_TMIN_TODAY,
        SLOT_TMAX_TODAY,
        SLOT_TMIN_NEXT,
    };

    enum eSegment : std::uint8_t {
        SEGMENT_PRE_SUNRISE = 0,
        SEGMENT_RISE,
        SEGMENT_DECLINE,
        SEGMENT_POST_SUNSET,
    };

    struct SSunWindow {
        NSunCalc::SSunTimes previous;
        NSunCalc::SSunTimes today;
    };

    struct SDayExtremes {
        double tminPrev  = 0.0;
        double tmaxPrev  = 0.0;
        double tminToday = 0.0;
        double tmaxToday = 0.0;
        double tminNext  = 0.0;

        double at(eExtremeSlot slot) const;
    };

    struct SSlotTerm {
        eExtremeSlot slot;
        double       coefficient;
    };

    // hourly_temp = constant + sum(coefficient * extreme)
    struct SDiurnalEquation {
        double                 constant = 0.0;
        std::vector<SSlotTerm> terms;

        double                 evaluate(const SDayExtremes& extremes) const;
    };

    // time of the daily maximum after solar noon
    constexpr double TMAX_OFFSET_HOURS = 2.0;

    double           tmaxTime(const NSunCalc::SSunTimes& sun);

    // boundaries are closed on the earlier segment: hour == sunrise is still pre-sunrise
    eSegment         segmentFor(int hour, const NSunCalc::SSunTimes& today);

    SDiurnalEquation equationFor(int hour, const SSunWindow& sun);
    double           idealizedTemp(int hour, const SDayExtremes& extremes, const SSunWindow& sun);
}
