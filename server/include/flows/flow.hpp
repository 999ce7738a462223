#pragma once

#include <string>

class Session;

// multi-message exchange owned by a session until it leaves the flow
class Flow {
public:
    Flow(Session *s);
    virtual ~Flow() = default;

    // called when the client socket is readable
    virtual void onReadable() = 0;

protected:
    Session *session;
};
