#include "notify/file_sink.hpp"

#include <stdexcept>

namespace autoheal {

FileSink::FileSink(std::string output_file)
    : output_file_(std::move(output_file)) {
    file_stream_.open(output_file_, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open notification file: " + output_file_);
    }
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::deliver(const NotificationEvent& event) {
    std::string line = event_to_json(event);
    line += '\n';
    file_stream_.write(line.data(), static_cast<std::streamsize>(line.size()));
    file_stream_.flush();
    return file_stream_.good();
}

void FileSink::shutdown() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + output_file_;
}

} // namespace autoheal
