#include "SeriesCurve.hpp"
#include <algorithm>

using namespace NTempSeries;

namespace NDiurnal {

    double SSeriesEquation::coefficientOf(const SExtremeRef& ref) const {
        for (const auto& term : terms) {
            if (term.ref == ref)
                return term.coefficient;
        }
        return 0.0;
    }

    CSeriesCurve::CSeriesCurve(const NSunCalc::CSunCalculator& calculator, const TDailyExtremes& daily) {
        m_windows.reserve(daily.size());

        for (size_t i = 0; i < daily.size(); ++i) {
            const auto today    = calculator.compute(daily[i].year, daily[i].month, daily[i].day);
            const auto previous = i == 0 ? calculator.compute(NCalendar::dayOfYear(NCalendar::previousDay(daily[i].date()))) : m_windows[i - 1].today;
            m_windows.push_back({previous, today});
        }
    }

    SExtremeRef CSeriesCurve::resolve(size_t day, eExtremeSlot slot) const {
        const size_t prev = day == 0 ? 0 : day - 1;
        const size_t next = day + 1 < m_windows.size() ? day + 1 : day;

        switch (slot) {
            case SLOT_TMIN_PREV: return {prev, EXTREME_TMIN};
            case SLOT_TMAX_PREV: return {prev, EXTREME_TMAX};
            case SLOT_TMIN_TODAY: return {day, EXTREME_TMIN};
            case SLOT_TMAX_TODAY: return {day, EXTREME_TMAX};
            case SLOT_TMIN_NEXT: return {next, EXTREME_TMIN};
        }
        return {day, EXTREME_TMIN};
    }

    SSeriesEquation CSeriesCurve::equationAt(size_t day, int hour) const {
        const auto      eq = equationFor(hour, m_windows.at(day));

        SSeriesEquation result{.constant = eq.constant};
        for (const auto& term : eq.terms) {
            const auto ref      = resolve(day, term.slot);
            auto       existing = std::find_if(result.terms.begin(), result.terms.end(), [&ref](const auto& t) { return t.ref == ref; });

            if (existing != result.terms.end())
                existing->coefficient += term.coefficient;
            else
                result.terms.push_back({ref, term.coefficient});
        }

        return result;
    }

    std::optional<double> CSeriesCurve::idealizedAt(size_t day, int hour, const TDailyExtremes& daily) const {
        const auto eq = equationAt(day, hour);

        double     t = eq.constant;
        for (const auto& term : eq.terms) {
            const auto& value = daily.at(term.ref.day).value(term.ref.variable).value;
            if (!value)
                return std::nullopt;
            t += term.coefficient * *value;
        }

        return t;
    }
}
