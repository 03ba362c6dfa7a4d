#include "HttpClient.h"

bool rangeResponseAccepted(long status, std::int64_t requestStart) {
    if (status == 206)
        return true;
    return status == 200 && requestStart == 0;
}
