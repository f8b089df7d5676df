#pragma once

/*compile-time defaults; ~/.tinyvirc can override the runtime ones*/

#ifndef TV_TAB_WIDTH
#define TV_TAB_WIDTH 4
#endif

/*filler for cells created by padding a line; rendered as a blank*/
#define TV_EMPTY_SLOT '\0'

#define TV_RC_NAME ".tinyvirc"

#ifndef TV_MAX_READ_RETRIES
#define TV_MAX_READ_RETRIES 8
#endif

#define TV_DEFAULT_ROWS 24
#define TV_DEFAULT_COLS 80
