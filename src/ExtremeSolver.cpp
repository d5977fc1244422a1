#include "ExtremeSolver.hpp"
#include "helpers/Log.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

using namespace NTempSeries;
using namespace NDiurnal;

namespace NExtremeSolver {

    // coefficients below this carry no usable information about an unknown
    static constexpr double COEFFICIENT_EPSILON = 1e-6;
    static constexpr double RANK_THRESHOLD      = 1e-10;
    static constexpr int    NO_UNKNOWN          = -1;

    CExtremeSolver::CExtremeSolver(double latitude, const SReconstructionOptions& options) : m_calculator(latitude), m_minEquations(options.minEquations) {
        if (m_minEquations < 1)
            throw std::invalid_argument("minEquations must be at least 1");
    }

    std::vector<CExtremeSolver::SRow> CExtremeSolver::collectRows(const std::vector<SExtremeRef>& targets, const CSeriesCurve& curve, const SHourlyGrid& grid,
                                                                  const TDailyExtremes& daily, std::vector<size_t>& counts) const {
        std::vector<SRow> rows;
        counts.assign(targets.size(), 0);

        size_t firstDay = targets.front().day, lastDay = targets.front().day;
        for (const auto& t : targets) {
            firstDay = std::min(firstDay, t.day);
            lastDay  = std::max(lastDay, t.day);
        }
        firstDay = firstDay == 0 ? 0 : firstDay - 1;
        lastDay  = std::min(lastDay + 1, daily.size() - 1);

        for (size_t day = firstDay; day <= lastDay; ++day) {
            for (int hour = 0; hour < HOURS_PER_DAY; ++hour) {
                const auto& observed = grid.temperatures[day][hour];
                if (!observed)
                    continue;

                const auto eq = curve.equationAt(day, hour);

                SRow       row{.coefficients = std::vector<double>(targets.size(), 0.0), .rhs = *observed - eq.constant};
                bool       usable = true;

                for (const auto& term : eq.terms) {
                    const auto target = std::find(targets.begin(), targets.end(), term.ref);
                    if (target != targets.end()) {
                        row.coefficients[target - targets.begin()] += term.coefficient;
                        continue;
                    }

                    const auto& value = daily[term.ref.day].value(term.ref.variable).value;
                    if (!value) {
                        // a second unknown outside this solve set
                        usable = false;
                        break;
                    }
                    row.rhs -= term.coefficient * *value;
                }

                if (!usable)
                    continue;

                bool involved = false;
                for (size_t i = 0; i < targets.size(); ++i) {
                    if (std::abs(row.coefficients[i]) > COEFFICIENT_EPSILON) {
                        ++counts[i];
                        involved = true;
                    }
                }

                if (involved)
                    rows.push_back(std::move(row));
            }
        }

        return rows;
    }

    std::optional<CExtremeSolver::SSolution> CExtremeSolver::leastSquares(const std::vector<SRow>& rows, size_t unknowns) const {
        if (rows.size() < unknowns)
            return std::nullopt;

        Eigen::MatrixXd A(rows.size(), unknowns);
        Eigen::VectorXd b(rows.size());
        for (size_t r = 0; r < rows.size(); ++r) {
            for (size_t c = 0; c < unknowns; ++c)
                A(r, c) = rows[r].coefficients[c];
            b(r) = rows[r].rhs;
        }

        Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(A.rows(), A.cols());
        qr.setThreshold(RANK_THRESHOLD);
        qr.compute(A);

        if ((size_t)qr.rank() < unknowns)
            return std::nullopt;

        const Eigen::VectorXd x = qr.solve(b);
        if (!x.allFinite())
            return std::nullopt;

        SSolution solution;
        solution.values.assign(x.data(), x.data() + x.size());
        solution.fitError = std::sqrt((A * x - b).squaredNorm() / (double)rows.size());
        return solution;
    }

    SSolveResult CExtremeSolver::solve(const std::vector<SHourlyRecord>& hourly, const TDailyExtremes& daily) const {
        validateDayTable(daily);

        SSolveResult result{.daily = daily};
        if (daily.empty())
            return result;

        const auto                       grid = indexHourly(hourly, daily);
        const CSeriesCurve               curve(m_calculator, daily);

        std::vector<SUnknownState>       unknowns;
        std::vector<std::array<int, 2>>  unknownOf(daily.size(), {NO_UNKNOWN, NO_UNKNOWN});
        for (size_t day = 0; day < daily.size(); ++day) {
            for (const auto variable : {EXTREME_TMIN, EXTREME_TMAX}) {
                if (daily[day].value(variable).known())
                    continue;
                unknownOf[day][variable] = (int)unknowns.size();
                unknowns.push_back({.ref = {day, variable}});
            }
        }

        struct SPending {
            size_t unknown;
            double value;
            double fitError;
        };

        bool progress = !unknowns.empty();
        while (progress) {
            progress = false;
            ++result.passes;

            // everything in this pass is solved against the state at its start
            const TDailyExtremes  snapshot = result.daily;
            std::vector<SPending> pending;
            std::vector<bool>     claimed(unknowns.size(), false);
            std::vector<size_t>   counts;

            for (size_t i = 0; i < unknowns.size(); ++i) {
                auto& u = unknowns[i];
                if (u.solved)
                    continue;

                const auto rows = collectRows({u.ref}, curve, grid, snapshot, counts);
                u.equations     = counts[0];

                if (counts[0] < m_minEquations)
                    continue;

                const auto solution = leastSquares(rows, 1);
                if (!solution) {
                    Debug::log(LOG, "solver: degenerate system for {} of day {}", extremeName(u.ref.variable), u.ref.day);
                    continue;
                }

                pending.push_back({i, solution->values[0], solution->fitError});
                claimed[i] = true;
            }

            // days where Tmin and Tmax are only constrained together
            for (size_t day = 0; day < daily.size(); ++day) {
                const int iMin = unknownOf[day][EXTREME_TMIN], iMax = unknownOf[day][EXTREME_TMAX];
                if (iMin == NO_UNKNOWN || iMax == NO_UNKNOWN)
                    continue;
                if (unknowns[iMin].solved || unknowns[iMax].solved || claimed[iMin] || claimed[iMax])
                    continue;

                const auto rows              = collectRows({unknowns[iMin].ref, unknowns[iMax].ref}, curve, grid, snapshot, counts);
                unknowns[iMin].equations     = std::max(unknowns[iMin].equations, counts[0]);
                unknowns[iMax].equations     = std::max(unknowns[iMax].equations, counts[1]);

                if (counts[0] < m_minEquations || counts[1] < m_minEquations)
                    continue;

                const auto solution = leastSquares(rows, 2);
                if (!solution) {
                    Debug::log(LOG, "solver: degenerate joint system for day {}", day);
                    continue;
                }

                pending.push_back({(size_t)iMin, solution->values[0], solution->fitError});
                pending.push_back({(size_t)iMax, solution->values[1], solution->fitError});
            }

            for (const auto& p : pending) {
                auto& u    = unknowns[p.unknown];
                u.solved   = true;
                u.fitError = p.fitError;
                result.daily[u.ref.day].value(u.ref.variable).set(p.value, SSolved{.equations = u.equations, .fitError = p.fitError});
                progress = true;
            }
        }

        size_t solved = 0;
        for (const auto& u : unknowns) {
            result.diagnostics.push_back({.day = u.ref.day, .variable = u.ref.variable, .equations = u.equations, .solved = u.solved, .fitError = u.fitError});

            if (u.solved)
                ++solved;
            else {
                const auto& rec = daily[u.ref.day];
                const auto  sun = m_calculator.compute(rec.year, rec.month, rec.day);
                Debug::log(LOG, "solver: {} of {:04}-{:02}-{:02} deferred with {} of {} equations (sun {} - {})", extremeName(u.ref.variable), rec.year, rec.month, rec.day,
                           u.equations, m_minEquations, NSunCalc::CSunCalculator::formatTime(sun.sunrise), NSunCalc::CSunCalculator::formatTime(sun.sunset));
            }
        }

        Debug::log(INFO, "solver: {} of {} unknown daily extremes solved in {} passes", solved, unknowns.size(), result.passes);

        return result;
    }
}
