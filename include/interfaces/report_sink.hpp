// report_sink.hpp
// Terminal consumer of finalized statistics

#pragma once

namespace cryptobt {

class Statistic;

class IReportSink {
public:
    virtual ~IReportSink() = default;
    virtual void generateReport(const Statistic& statistic) = 0;
};

} // namespace cryptobt
