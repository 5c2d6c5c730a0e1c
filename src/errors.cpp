#include "errors.hpp"

namespace swiv {

Response BadRequest::response() const {
    return Response::text(400, "Bad request");
}

Response Unauthorized::response() const {
    return Response(401,
                    {
                        {"Content-Type", "text/plain"},
                        {"WWW-Authenticate", "Basic realm=\"swiv\""},
                    },
                    std::string("Unauthorized"));
}

} // namespace swiv
