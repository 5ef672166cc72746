#include "exceptions.h"

using std::exception;
using std::string;

string getMessage(const exception& e) {
    string result(e.what());
    try {
        std::rethrow_if_nested(e);
    } catch (const exception& innerException) {
        result += "\n" + getMessage(innerException);
    }

    return result;
}
