#pragma once

#include <cstdint>

namespace smppnet {

// SMPP v3.4 command_status values.
namespace status {
constexpr uint32_t ESME_ROK              = 0x00000000;
constexpr uint32_t ESME_RINVMSGLEN       = 0x00000001;
constexpr uint32_t ESME_RINVCMDLEN       = 0x00000002;
constexpr uint32_t ESME_RINVCMDID        = 0x00000003;
constexpr uint32_t ESME_RINVBNDSTS       = 0x00000004;
constexpr uint32_t ESME_RALYBND          = 0x00000005;
constexpr uint32_t ESME_RINVPRTFLG       = 0x00000006;
constexpr uint32_t ESME_RINVREGDLVFLG    = 0x00000007;
constexpr uint32_t ESME_RSYSERR          = 0x00000008;
constexpr uint32_t ESME_RINVSRCADR       = 0x0000000A;
constexpr uint32_t ESME_RINVDSTADR       = 0x0000000B;
constexpr uint32_t ESME_RINVMSGID        = 0x0000000C;
constexpr uint32_t ESME_RBINDFAIL        = 0x0000000D;
constexpr uint32_t ESME_RINVPASWD        = 0x0000000E;
constexpr uint32_t ESME_RINVSYSID        = 0x0000000F;
constexpr uint32_t ESME_RCANCELFAIL      = 0x00000011;
constexpr uint32_t ESME_RREPLACEFAIL     = 0x00000013;
constexpr uint32_t ESME_RMSGQFUL         = 0x00000014;
constexpr uint32_t ESME_RINVSERTYP       = 0x00000015;
constexpr uint32_t ESME_RINVNUMDESTS     = 0x00000033;
constexpr uint32_t ESME_RINVDLNAME       = 0x00000034;
constexpr uint32_t ESME_RINVDESTFLAG     = 0x00000040;
constexpr uint32_t ESME_RINVSUBREP       = 0x00000042;
constexpr uint32_t ESME_RINVESMCLASS     = 0x00000043;
constexpr uint32_t ESME_RCNTSUBDL        = 0x00000044;
constexpr uint32_t ESME_RSUBMITFAIL      = 0x00000045;
constexpr uint32_t ESME_RINVSRCTON       = 0x00000048;
constexpr uint32_t ESME_RINVSRCNPI       = 0x00000049;
constexpr uint32_t ESME_RINVDSTTON       = 0x00000050;
constexpr uint32_t ESME_RINVDSTNPI       = 0x00000051;
constexpr uint32_t ESME_RINVSYSTYP       = 0x00000053;
constexpr uint32_t ESME_RINVREPFLAG      = 0x00000054;
constexpr uint32_t ESME_RINVNUMMSGS      = 0x00000055;
constexpr uint32_t ESME_RTHROTTLED       = 0x00000058;
constexpr uint32_t ESME_RINVSCHED        = 0x00000061;
constexpr uint32_t ESME_RINVEXPIRY       = 0x00000062;
constexpr uint32_t ESME_RINVDFTMSGID     = 0x00000063;
constexpr uint32_t ESME_RX_T_APPN        = 0x00000064;
constexpr uint32_t ESME_RX_P_APPN        = 0x00000065;
constexpr uint32_t ESME_RX_R_APPN        = 0x00000066;
constexpr uint32_t ESME_RQUERYFAIL       = 0x00000067;
constexpr uint32_t ESME_RINVOPTPARSTREAM = 0x000000C0;
constexpr uint32_t ESME_ROPTPARNOTALLWD  = 0x000000C1;
constexpr uint32_t ESME_RINVPARLEN       = 0x000000C2;
constexpr uint32_t ESME_RMISSINGOPTPARAM = 0x000000C3;
constexpr uint32_t ESME_RINVOPTPARAMVAL  = 0x000000C4;
constexpr uint32_t ESME_RDELIVERYFAILURE = 0x000000FE;
constexpr uint32_t ESME_RUNKNOWNERR      = 0x000000FF;
} // namespace status

// Human readable text for a command_status; "Unknown status" if not in the table.
const char* statusDescription(uint32_t status);

} // namespace smppnet
