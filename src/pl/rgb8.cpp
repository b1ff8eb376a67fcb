#include "pl/rgb8.h"

namespace pl {

const RGB8 RGB8::Black(0, 0, 0);
const RGB8 RGB8::Red(255, 0, 0);
const RGB8 RGB8::Green(0, 255, 0);
const RGB8 RGB8::Blue(0, 0, 255);
const RGB8 RGB8::White(255, 255, 255);
const RGB8 RGB8::Yellow(255, 255, 0);
const RGB8 RGB8::Cyan(0, 255, 255);
const RGB8 RGB8::Magenta(255, 0, 255);

} // namespace pl
