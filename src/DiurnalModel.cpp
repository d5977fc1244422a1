#include "DiurnalModel.hpp"
#include <algorithm>
#include <cmath>

namespace NDiurnal {

    static constexpr double HOURS_PER_DAY     = 24.0;
    static constexpr double ZERO_COEFFICIENT  = 1e-12;
    static constexpr double MIN_NIGHT_HOURS   = 1.0;

    double SDayExtremes::at(eExtremeSlot slot) const {
        switch (slot) {
            case SLOT_TMIN_PREV: return tminPrev;
            case SLOT_TMAX_PREV: return tmaxPrev;
            case SLOT_TMIN_TODAY: return tminToday;
            case SLOT_TMAX_TODAY: return tmaxToday;
            case SLOT_TMIN_NEXT: return tminNext;
        }
        return 0.0;
    }

    double SDiurnalEquation::evaluate(const SDayExtremes& extremes) const {
        double t = constant;
        for (const auto& term : terms)
            t += term.coefficient * extremes.at(term.slot);
        return t;
    }

    // share of the Tmin -> Tmax amplitude reached at a given hour of daylight
    static double sineFraction(double hour, const NSunCalc::SSunTimes& sun) {
        return std::sin(M_PI * (hour - sun.sunrise) / (sun.daylength + 2.0 * TMAX_OFFSET_HOURS));
    }

    static double sunsetFraction(const NSunCalc::SSunTimes& sun) {
        return sineFraction(sun.sunset, sun);
    }

    // 0 at sunset, 1 when the next minimum is reached
    static double nightDecay(double hoursSinceSunset, double nightLength) {
        if (nightLength <= MIN_NIGHT_HOURS)
            return 1.0;
        if (hoursSinceSunset <= 0.0)
            return 0.0;
        return std::clamp(std::log(hoursSinceSunset) / std::log(nightLength), 0.0, 1.0);
    }

    double tmaxTime(const NSunCalc::SSunTimes& sun) {
        return (sun.sunrise + sun.sunset) / 2.0 + TMAX_OFFSET_HOURS;
    }

    eSegment segmentFor(int hour, const NSunCalc::SSunTimes& today) {
        if (hour <= today.sunrise)
            return SEGMENT_PRE_SUNRISE;
        if (hour <= std::min(tmaxTime(today), today.sunset))
            return SEGMENT_RISE;
        if (hour <= today.sunset)
            return SEGMENT_DECLINE;
        return SEGMENT_POST_SUNSET;
    }

    static void addTerm(SDiurnalEquation& eq, eExtremeSlot slot, double coefficient) {
        if (std::abs(coefficient) > ZERO_COEFFICIENT)
            eq.terms.push_back({slot, coefficient});
    }

    SDiurnalEquation equationFor(int hour, const SSunWindow& sun) {
        SDiurnalEquation eq;

        switch (segmentFor(hour, sun.today)) {
            case SEGMENT_PRE_SUNRISE: {
                const double s     = sunsetFraction(sun.previous);
                const double decay = nightDecay(hour + HOURS_PER_DAY - sun.previous.sunset, HOURS_PER_DAY - sun.previous.daylength);
                addTerm(eq, SLOT_TMIN_PREV, (1.0 - s) * (1.0 - decay));
                addTerm(eq, SLOT_TMAX_PREV, s * (1.0 - decay));
                addTerm(eq, SLOT_TMIN_TODAY, decay);
                break;
            }
            case SEGMENT_RISE:
            case SEGMENT_DECLINE: {
                const double s = sineFraction(hour, sun.today);
                addTerm(eq, SLOT_TMIN_TODAY, 1.0 - s);
                addTerm(eq, SLOT_TMAX_TODAY, s);
                break;
            }
            case SEGMENT_POST_SUNSET: {
                const double s     = sunsetFraction(sun.today);
                const double decay = nightDecay(hour - sun.today.sunset, HOURS_PER_DAY - sun.today.daylength);
                addTerm(eq, SLOT_TMIN_TODAY, (1.0 - s) * (1.0 - decay));
                addTerm(eq, SLOT_TMAX_TODAY, s * (1.0 - decay));
                addTerm(eq, SLOT_TMIN_NEXT, decay);
                break;
            }
        }

        return eq;
    }

    double idealizedTemp(int hour, const SDayExtremes& extremes, const SSunWindow& sun) {
        return equationFor(hour, sun).evaluate(extremes);
    }
}
