// Copyright (c) 2025 Christopher Broschard
// All rights reserved.
//
// This source code is provided for personal, educational, and
// non-commercial use only. Redistribution, modification, or use
// of this code in whole or in part for any other purpose is
// strictly prohibited without the prior written consent of the author.
#ifndef SIGNALTYPES_H_INCLUDED
#define SIGNALTYPES_H_INCLUDED

// Pin levels as seen on the receiver inputs. select is active low.
struct RawSignal
{
    bool select = true; // High = idle
    bool clock = false;
    bool data = false;
};

// Output of the two stage synchronizer, safe to use on the internal timebase
struct SyncedSignal
{
    bool select = true;
    bool clock = false;
    bool data = false;

    inline bool selectAsserted() const { return !select; }
};

// One tick wide pulses derived from the synced lines
struct EdgeEvents
{
    bool selectFalling = false;
    bool clockRising = false;

    inline bool any() const { return selectFalling || clockRising; }
};

#endif // SIGNALTYPES_H_INCLUDED
