#ifndef FAULT_CODES_HPP
#define FAULT_CODES_HPP

// Scheduling
#define FAULT_CYCLE_DETECTED 1
#define FAULT_UNDATED_TASK 2
#define FAULT_DATE_OUT_OF_RANGE 3

// Calendar
#define FAULT_EMPTY_WORKWEEK 10
#define FAULT_INVALID_WEEKDAY 11

#endif
