#include "TitleChannel.hpp"

namespace sg {
void TitleChannel::sendTitleMessage(const json& message) {
  TitleMessage titleMessage;
  titleMessage.set_json(message.dump());
  channel->send(TITLE_MESSAGE, titleMessage);
}

int64_t TitleChannel::addTitleMessageHandler(TitleMessageHandler handler) {
  return channel->addMessageHandler([handler](const Envelope& envelope) {
    if (envelope.type() != TITLE_MESSAGE) {
      return;
    }
    try {
      TitleMessage titleMessage = parsePayload<TitleMessage>(envelope);
      handler(json::parse(titleMessage.json()));
    } catch (const json::parse_error& pe) {
      LOG(WARNING) << "Dropping title message that is not JSON: " << pe.what();
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Dropping title message: " << ex.what();
    }
  });
}
}  // namespace sg
