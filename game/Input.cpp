#include "game/Game.hpp"

#include <raylib.h>

void ReadInput(Game &game) {
  const auto &k = cfg::keys;

  if (IsKeyPressed(k.flap) || IsKeyPressed(k.flapAlt) ||
      IsMouseButtonPressed(k.mouseFlap)) {
    PostActivation(game.mailbox);
  }

  if (IsKeyPressed(k.quit)) {
    game.wantsExit = true;
  }
}
