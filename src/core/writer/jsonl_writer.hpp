#ifndef CORE_WRITER_JSONL_WRITER_HPP
#define CORE_WRITER_JSONL_WRITER_HPP

#include <nlohmann/json.hpp>

#include "writer.hpp"

namespace core::writer {
class JsonlWriter : public Writer {
public:
    explicit JsonlWriter(std::ostream &out) : out_(out) {}

    Err Begin() override { return Err::Ok; }
    Err Write(const AccessRecord &record) override;
    Err Finish() override;

    static nlohmann::ordered_json ToJson(const AccessRecord &record);

private:
    std::ostream &out_;
};
}  // namespace core::writer

#endif
