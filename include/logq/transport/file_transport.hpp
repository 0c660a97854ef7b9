#ifndef LOGQ_FILE_TRANSPORT_HPP
#define LOGQ_FILE_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace logq {
    class FileTransport : public ITransport {
    public:
        /// @throws std::runtime_error if the file cannot be opened for append.
        explicit FileTransport(const std::string &filename) : m_filename(filename) {
            m_file.open(filename, std::ios::app | std::ios::binary);
            if (!m_file.is_open()) {
                throw std::runtime_error("Failed to open log file: " + filename);
            }
        }

        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_file << formattedEntry << '\n';
            m_file.flush();
        }

        void writeRaw(const std::string &data) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_file << data;
            m_file.flush();
        }

        void flush() override {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_file.flush();
        }

        const std::string &filename() const { return m_filename; }

    private:
        std::string m_filename;
        std::ofstream m_file;
        std::mutex m_mutex;
    };
} // namespace logq

#endif // LOGQ_FILE_TRANSPORT_HPP
