#include "errors.h"
#include "logger.h"

#include <ostream>

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingLength:      return "MissingLength";
        case ErrorKind::InvalidLength:      return "InvalidLength";
        case ErrorKind::InvalidParallelism: return "InvalidParallelism";
        case ErrorKind::EmptyResource:      return "EmptyResource";
        case ErrorKind::TransportError:     return "TransportError";
        case ErrorKind::UnexpectedStatus:   return "UnexpectedStatus";
        case ErrorKind::IOError:            return "IOError";
        case ErrorKind::InvalidConfig:      return "InvalidConfig";
        case ErrorKind::JobFailed:          return "JobFailed";
    }
    return "Unknown";
}

int runReportingErrors(const std::function<int()>& body, std::ostream& err) {
    try {
        return body();
    } catch (const HttpError& e) {
        Logger::instance().error(std::string(e.what())
            + " (curl=" + std::to_string(e.curlCode())
            + " http=" + std::to_string(e.httpStatus()) + ")");
        err << "error (" << errorKindName(e.kind()) << "): " << e.what() << std::endl;
    } catch (const DownloadError& e) {
        Logger::instance().error(e.what());
        err << "error (" << errorKindName(e.kind()) << "): " << e.what() << std::endl;
    } catch (const std::exception& e) {
        // Thread creation, allocation and other failures outside the core.
        Logger::instance().error(std::string("Unexpected failure: ") + e.what());
        err << "error: " << e.what() << std::endl;
    }
    return 1;
}
