#include "DeadReckon.h"

// Write the true state of the simulated airframe
void DeadReckon::Log_Write_Sim()
{
    // @LoggerMessage: SIM
    // @Description: Simulated airframe state
    // @Field: TimeUS: Time since system startup
    // @Field: PN: position north of home
    // @Field: PE: position east of home
    // @Field: Alt: altitude above home
    // @Field: Roll: roll angle
    // @Field: Pitch: pitch angle
    // @Field: Yaw: heading
    // @Field: Mode: flight mode
    // @Field: DR: dead reckoning failsafe stage
    logger.Write("SIM", "TimeUS,PN,PE,Alt,Roll,Pitch,Yaw,Mode,DR", "QffffffBB",
                 DR_HAL::micros64(),
                 (double)sim.pos_n,
                 (double)sim.pos_e,
                 (double)sim.alt,
                 (double)sim.roll_deg,
                 (double)sim.pitch_deg,
                 (double)sim.yaw_deg,
                 uint8_t(control_mode),
                 uint8_t(failsafe.stage()));
}
