#pragma once

/*compile time defaults, override with -D*/

#ifndef BON_LINE_WIDTH
#define BON_LINE_WIDTH 24
#endif

#ifndef BON_MAX_DIGITS
#define BON_MAX_DIGITS 5
#endif

#ifndef BON_FEED_LINES
#define BON_FEED_LINES 6
#endif

#ifndef BON_IDLE_DELAY_MS
#define BON_IDLE_DELAY_MS 50
#endif

#ifndef BON_ERROR_DELAY_MS
#define BON_ERROR_DELAY_MS 200
#endif

#define BON_EVENT_RECORD_SIZE 24
#define BON_RC_NAME ".bonbonrc"
#define BON_FALLBACK_LABEL "Spielzeug"
