#pragma once

// Busz állapotok
enum class BusState {
    UP,
    DEGRADED  // legalább egy fatális hiba jelezve
};

// A fókusz-szűrő három kimenete
enum class FocusOutcome {
    NEUTRALIZED, // injekció gyanú, rövidzár
    PRUNED,      // chaotic etika, nincs fókusz-redukció
    FOCUSED
};
