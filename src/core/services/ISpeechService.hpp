#pragma once

#include <QString>

namespace fnav {

class ISpeechService {
public:
    virtual ~ISpeechService() = default;

    /// Queue text for speaking. Fire-and-forget: there is no delivery
    /// confirmation and no error reported back to the caller.
    virtual void requestSpeech(const QString& text) = 0;
};

} // namespace fnav
