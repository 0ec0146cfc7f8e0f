#pragma once

#include <functional>
#include <memory>
#include <string>

namespace qm::config { struct ConnectionConfig; }

namespace qm::remote {

class Client;

// Authenticated connection to the service, able to hand out the two client
// flavours the harness works with.
class Session {
public:
    virtual ~Session() = default;

    virtual std::shared_ptr<Client> adminClient() = 0;
    virtual std::shared_ptr<Client> userClient(const std::string& userId) = 0;
};

using SessionFactory = std::function<std::unique_ptr<Session>(const config::ConnectionConfig&)>;

}
