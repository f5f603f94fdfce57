// text_report.hpp
// Plain text performance report written to a file

#pragma once

#include <fstream>
#include <iomanip>
#include <ostream>
#include <string>
#include "../core/exceptions.hpp"
#include "../core/logger.hpp"
#include "../interfaces/report_sink.hpp"
#include "../statistics/statistic.hpp"

namespace cryptobt {

class TextReport : public IReportSink {
private:
    std::string output_path_;

    static void writeDrawdown(std::ostream& out, const MaxDrawdown& dd) {
        out << "  Max drawdown:       " << dd.percentage << "%"
            << " (high " << dd.highest.value << " at " << toUnixSeconds(dd.highest.time)
            << ", low " << dd.lowest.value << " at " << toUnixSeconds(dd.lowest.time) << ")\n";
    }

public:
    explicit TextReport(std::string output_path) : output_path_(std::move(output_path)) {}

    // Writes to any stream; generateReport uses the configured file
    static void write(std::ostream& out, const Statistic& statistic) {
        out << std::fixed << std::setprecision(4);
        out << "========================================\n";
        out << "BACKTEST REPORT\n";
        out << "========================================\n";
        out << "Strategy: " << statistic.strategyName() << "\n";
        if (!statistic.strategyDescription().empty()) {
            out << "  " << statistic.strategyDescription() << "\n";
        }
        out << "\n";

        for (const auto& [key, r] : statistic.results()) {
            out << "--- " << key.toString() << " ---\n";
            out << "  Equity points:      " << r.equity_points << "\n";
            out << "  Initial funds:      " << r.initial_funds << "\n";
            out << "  Final value:        " << r.final_value << "\n";
            out << "  Final quantity:     " << r.final_quantity << "\n";
            out << "  Final funds:        " << r.final_funds << "\n";
            out << "  Total return:       " << r.total_return_pct << "%\n";
            out << "  Buy and hold:       " << r.buy_and_hold_pct << "%\n";
            out << "  Sharpe ratio:       " << r.sharpe_ratio << "\n";
            out << "  Win rate:           " << r.win_rate * 100.0 << "%\n";
            out << "  Realized PnL:       " << r.realized_pnl << "\n";
            out << "  Unrealized PnL:     " << r.unrealized_pnl << "\n";
            out << "  Orders:             " << r.buy_orders << " buy, " << r.sell_orders
                << " sell, " << r.rejected_orders << " rejected\n";
            out << "  Fees:               " << r.total_fees << "\n";
            writeDrawdown(out, r.max_drawdown);
            out << "\n";
        }

        const OverallResult& overall = statistic.overall();
        out << "--- Overall ---\n";
        out << "  Initial funds:      " << overall.initial_funds << "\n";
        out << "  Final value:        " << overall.final_value << "\n";
        out << "  Total return:       " << overall.total_return_pct << "%\n";
        out << "  Orders:             " << overall.buy_orders << " buy, " << overall.sell_orders
            << " sell, " << overall.rejected_orders << " rejected\n";
        out << "  Fees:               " << overall.total_fees << "\n";
        writeDrawdown(out, overall.max_drawdown);
        if (overall.best_pair) out << "  Best pair:          " << overall.best_pair->toString() << "\n";
        if (overall.worst_pair) out << "  Worst pair:         " << overall.worst_pair->toString() << "\n";
        out << "========================================\n";
    }

    void generateReport(const Statistic& statistic) override {
        if (!statistic.isFinalized()) {
            throw BacktestException("refusing to report unfinalized statistics",
                                    ErrorCode::InvalidState);
        }
        std::ofstream file(output_path_);
        if (!file.is_open()) {
            throw ReportException("failed to open report file: " + output_path_);
        }
        write(file, statistic);
        CRYPTOBT_LOG_INFO(logtag::Report, "report written to " << output_path_);
    }

    const std::string& outputPath() const { return output_path_; }
};

} // namespace cryptobt
