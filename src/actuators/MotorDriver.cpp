#include "actuators/MotorDriver.h"

MotorDriver::MotorDriver(DigitalPins& pins,
                         const SideMotors::Wiring& left,
                         const SideMotors::Wiring& right,
                         bool invert_left,
                         bool invert_right)
: _left(pins, left, invert_left),
  _right(pins, right, invert_right)
{
}

void MotorDriver::begin() {
  _left.begin();
  _right.begin();
  _current = TankCommand();
}

void MotorDriver::setCommand(DriveCommand cmd) {
  setTank(toTank(cmd));
}

void MotorDriver::setTank(const TankCommand& cmd) {
  _left.setDirection(cmd.left);
  _right.setDirection(cmd.right);
  _current = cmd;
}
