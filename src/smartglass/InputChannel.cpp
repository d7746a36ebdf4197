#include "InputChannel.hpp"

namespace sg {
void InputChannel::sendGamepadState(const Gamepad& state) {
  Gamepad frame = state;
  if (!frame.has_timestamp()) {
    frame.set_timestamp(chrono::duration_cast<chrono::milliseconds>(
                            chrono::system_clock::now().time_since_epoch())
                            .count());
  }
  VLOG(2) << "Gamepad buttons " << frame.buttons() << " on channel "
          << channel->getChannelId();
  channel->send(GAMEPAD, frame);
}
}  // namespace sg
