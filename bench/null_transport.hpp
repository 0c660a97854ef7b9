#pragma once
#include "logq/transport/transport_interface.hpp"

namespace logq {

class NullTransport : public ITransport {
public:
    void write(const std::string&) override {}
    void writeRaw(const std::string&) override {}
};

} // namespace logq
