#pragma once

#include "notify/inotification_sink.hpp"

#include <fstream>
#include <string>

namespace autoheal {

/**
 * @brief Appends one JSON object per event to a file (JSONL)
 */
class FileSink : public INotificationSink {
public:
    explicit FileSink(std::string output_file);
    ~FileSink() override;

    [[nodiscard]] bool deliver(const NotificationEvent& event) override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

private:
    std::string output_file_;
    std::ofstream file_stream_;
};

} // namespace autoheal
