#include "smppnet_status.h"

#include <unordered_map>

namespace smppnet {

const char* statusDescription(uint32_t code) {
    using namespace status;
    static const std::unordered_map<uint32_t, const char*> descriptions = {
        {ESME_ROK,              "No Error"},
        {ESME_RINVMSGLEN,       "Message Length is invalid"},
        {ESME_RINVCMDLEN,       "Command Length is invalid"},
        {ESME_RINVCMDID,        "Invalid Command ID"},
        {ESME_RINVBNDSTS,       "Incorrect BIND Status for given command"},
        {ESME_RALYBND,          "ESME Already in Bound State"},
        {ESME_RINVPRTFLG,       "Invalid Priority Flag"},
        {ESME_RINVREGDLVFLG,    "Invalid Registered Delivery Flag"},
        {ESME_RSYSERR,          "System Error"},
        {ESME_RINVSRCADR,       "Invalid Source Address"},
        {ESME_RINVDSTADR,       "Invalid Dest Addr"},
        {ESME_RINVMSGID,        "Message ID is invalid"},
        {ESME_RBINDFAIL,        "Bind Failed"},
        {ESME_RINVPASWD,        "Invalid Password"},
        {ESME_RINVSYSID,        "Invalid System ID"},
        {ESME_RCANCELFAIL,      "Cancel SM Failed"},
        {ESME_RREPLACEFAIL,     "Replace SM Failed"},
        {ESME_RMSGQFUL,         "Message Queue Full"},
        {ESME_RINVSERTYP,       "Invalid Service Type"},
        {ESME_RINVNUMDESTS,     "Invalid number of destinations"},
        {ESME_RINVDLNAME,       "Invalid Distribution List name"},
        {ESME_RINVDESTFLAG,     "Destination flag is invalid (submit_multi)"},
        {ESME_RINVSUBREP,       "Invalid 'submit with replace' request"},
        {ESME_RINVESMCLASS,     "Invalid esm_class field data"},
        {ESME_RCNTSUBDL,        "Cannot Submit to Distribution List"},
        {ESME_RSUBMITFAIL,      "submit_sm or submit_multi failed"},
        {ESME_RINVSRCTON,       "Invalid Source address TON"},
        {ESME_RINVSRCNPI,       "Invalid Source address NPI"},
        {ESME_RINVDSTTON,       "Invalid Destination address TON"},
        {ESME_RINVDSTNPI,       "Invalid Destination address NPI"},
        {ESME_RINVSYSTYP,       "Invalid system_type field"},
        {ESME_RINVREPFLAG,      "Invalid replace_if_present flag"},
        {ESME_RINVNUMMSGS,      "Invalid number of messages"},
        {ESME_RTHROTTLED,       "Throttling error (ESME has exceeded allowed message limits)"},
        {ESME_RINVSCHED,        "Invalid Scheduled Delivery Time"},
        {ESME_RINVEXPIRY,       "Invalid message validity period (Expiry time)"},
        {ESME_RINVDFTMSGID,     "Predefined Message Invalid or Not Found"},
        {ESME_RX_T_APPN,        "ESME Receiver Temporary App Error Code"},
        {ESME_RX_P_APPN,        "ESME Receiver Permanent App Error Code"},
        {ESME_RX_R_APPN,        "ESME Receiver Reject Message Error Code"},
        {ESME_RQUERYFAIL,       "query_sm request failed"},
        {ESME_RINVOPTPARSTREAM, "Error in the optional part of the PDU Body"},
        {ESME_ROPTPARNOTALLWD,  "Optional Parameter not allowed"},
        {ESME_RINVPARLEN,       "Invalid Parameter Length"},
        {ESME_RMISSINGOPTPARAM, "Expected Optional Parameter missing"},
        {ESME_RINVOPTPARAMVAL,  "Invalid Optional Parameter Value"},
        {ESME_RDELIVERYFAILURE, "Delivery Failure (used for data_sm_resp)"},
        {ESME_RUNKNOWNERR,      "Unknown Error"},
    };

    auto it = descriptions.find(code);
    return it != descriptions.end() ? it->second : "Unknown status";
}

} // namespace smppnet
