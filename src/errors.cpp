// DeepBook SDK - Error Helpers

#include <deepbook/errors.hpp>

namespace deepbook {

std::string error_chain(const std::exception& e) {
    std::string result = e.what();
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        result += ": caused by: " + error_chain(inner);
    } catch (...) {
        result += ": caused by: unknown error";
    }
    return result;
}

}  // namespace deepbook
