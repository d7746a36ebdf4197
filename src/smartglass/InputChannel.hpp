#ifndef __SG_INPUT_CHANNEL__
#define __SG_INPUT_CHANNEL__

#include "ChannelTransport.hpp"

namespace sg {
/** @brief Gamepad button bits understood by the system input service. */
enum GamepadButton : uint32_t {
  GAMEPAD_CLEAR = 0x0000,
  GAMEPAD_ENROLL = 0x0001,
  GAMEPAD_NEXUS = 0x0002,
  GAMEPAD_MENU = 0x0004,
  GAMEPAD_VIEW = 0x0008,
  GAMEPAD_A = 0x0010,
  GAMEPAD_B = 0x0020,
  GAMEPAD_X = 0x0040,
  GAMEPAD_Y = 0x0080,
  GAMEPAD_DPAD_UP = 0x0100,
  GAMEPAD_DPAD_DOWN = 0x0200,
  GAMEPAD_DPAD_LEFT = 0x0400,
  GAMEPAD_DPAD_RIGHT = 0x0800,
  GAMEPAD_LEFT_SHOULDER = 0x1000,
  GAMEPAD_RIGHT_SHOULDER = 0x2000,
  GAMEPAD_LEFT_THUMBSTICK = 0x4000,
  GAMEPAD_RIGHT_THUMBSTICK = 0x8000,
};

/**
 * @brief The SystemInput channel.
 */
class InputChannel {
 public:
  explicit InputChannel(shared_ptr<ChannelTransport> _channel)
      : channel(_channel) {}

  /**
   * @brief Sends one gamepad frame, stamped with the current time when the
   * caller left the timestamp unset.
   */
  void sendGamepadState(const Gamepad& state);

  uint64_t getChannelId() const { return channel->getChannelId(); }

  void shutdown() { channel->shutdown(); }

 protected:
  shared_ptr<ChannelTransport> channel;
};
}  // namespace sg

#endif  // __SG_INPUT_CHANNEL__
