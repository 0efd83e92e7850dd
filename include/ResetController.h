// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef RESETCONTROLLER_H
#define RESETCONTROLLER_H

// forward declares
class EdgeDetector;
class FrameAssembler;
class Logging;
class RegisterBank;
class Synchronizer;

class ResetController
{
public:
    ResetController(
        Synchronizer& sync,
        EdgeDetector& edges,
        FrameAssembler& assembler,
        RegisterBank& bank);

    ~ResetController() = default;

    inline void attachLogInstance(Logging* logger) { logger_ = logger; }

    // Called on every tick rst_n is held low
    void holdReset();

    // Called on the first tick after rst_n is released
    void releaseReset();

    // Power on: force everything idle regardless of rst_n
    void powerOnReset();

    inline bool isHeld() const { return held_; }

    // Save state restore, no side effects on the blocks
    inline void restoreHeld(bool held) { held_ = held; }

private:
    Synchronizer& sync_;
    EdgeDetector& edges_;
    FrameAssembler& assembler_;
    RegisterBank& bank_;

    Logging* logger_;
    bool held_;

    void resetAll();
};

#endif // RESETCONTROLLER_H
