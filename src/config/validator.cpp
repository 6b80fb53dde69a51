#include "validator.hpp"
#include "errors.hpp"
#include <nlohmann/json-schema.hpp>
#include <sstream>
#include <vector>

namespace config {

    // 收集所有校验错误，而不是遇到第一个就停止
    class collecting_error_handler : public nlohmann::json_schema::basic_error_handler {
    public:
        void error(const nlohmann::json::json_pointer &ptr,
                   const nlohmann::json &instance,
                   const std::string &message) override {
            nlohmann::json_schema::basic_error_handler::error(ptr, instance, message);
            std::ostringstream oss;
            std::string location = ptr.to_string();
            oss << "at " << (location.empty() ? "/" : location)
                << " (value: " << instance.dump() << "): " << message;
            errors.push_back(oss.str());
        }

        bool has_errors() const { return !errors.empty(); }
        std::string get_error_report() const {
            std::ostringstream oss;
            for (size_t i = 0; i < errors.size(); ++i) {
                oss << "\n  [" << i + 1 << "] " << errors[i];
            }
            return oss.str();
        }

    private:
        std::vector<std::string> errors;
    };

    void validate_document(const nlohmann::json& document, const nlohmann::json& schema,
                           const std::string& what) {
        // schema 都是内置的，不含 $ref，不需要 loader
        nlohmann::json_schema::json_validator validator(nullptr, nlohmann::json_schema::default_string_format_check);
        validator.set_root_schema(schema);

        collecting_error_handler err;
        validator.validate(document, err);

        if (err.has_errors()) {
            throw ParseError(what + " does not match the expected shape:" + err.get_error_report());
        }
    }

}  // namespace config
