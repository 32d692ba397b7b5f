#include "utils.hpp"

#include "consensus/consensus.h"
#include "serialize.h"
#include "version.h"
#include "util/strencodings.h"

#include <iostream>
#include <sstream>
#include <string>


namespace ordguard {

std::string FormatAmount(CAmount amount)
{
    if (!amount) return "0";
    std::string sign;
    if (amount < 0) {
        sign = "-";
        amount = -amount;
    }
    static const size_t digits = std::to_string(COIN).length() - 1;
    std::string str_amount =  std::to_string(amount);
    std::ostringstream buf;
    buf << sign;
    if (amount < COIN) {
        buf << "0.";
        for (size_t i = 0; i < (digits - str_amount.length()); ++i) buf << '0';
        size_t print_digits = str_amount.length();
        for (;!(amount % 10);amount /= 10) {
            --print_digits;
        }
        buf << str_amount.substr(0, print_digits);
        return buf.str();
    }
    else {
        buf << str_amount.substr(0, str_amount.length() - digits) << '.' << str_amount.substr(str_amount.length() - digits);
    }

    std::string res = buf.str();

    size_t cut_zeroes = 0;
    for (auto i = res.rbegin(); i != res.rend() && *i == '0'; ++i, ++cut_zeroes) ;
    if (res[res.length() - cut_zeroes - 1] == '.') ++cut_zeroes;

    return res.substr(0, res.length() - cut_zeroes);
}

size_t GetVirtualSize(const CMutableTransaction& tx)
{
    size_t tx_size = GetSerializeSize(tx, PROTOCOL_VERSION | SERIALIZE_TRANSACTION_NO_WITNESS);
    size_t tx_wit_size = GetSerializeSize(tx, PROTOCOL_VERSION);
    return (tx_size * (WITNESS_SCALE_FACTOR - 1) + tx_wit_size + WITNESS_SCALE_FACTOR - 1) / WITNESS_SCALE_FACTOR;
}

template <typename T>
void LogTx(const T& tx)
{
    std::clog << "Transaction " << tx.GetHash().GetHex() << " {\n"
              << "\tnLockTime: " << tx.nLockTime << "\n"
              << "\tvin {\n";
    bool first_in = true;
    for(const auto& in: tx.vin)
    {
        if(first_in) first_in = false;
        else std::clog << "\t\t------------------------------------------------\n";

        std::clog << "\t\t" << in.prevout.hash.GetHex() << " : "
                  << in.prevout.n << "\n"
                  << "\t\tWitness {\n";

        for(const auto& wel: in.scriptWitness.stack)
        {
            std::clog << "\t\t\t{" << HexStr(wel) << "}\n";
        }
        std::clog << "\t\t}\n";
    }
    std::clog << "\t}\n";

    std::clog << "\tvout {\n";
    bool first_out = true;
    for(const auto& out: tx.vout)
    {
        if(first_out) first_out = false;
        else std::clog << "\t\t------------------------------------------------\n";

        std::clog << "\t\tAmount: " << FormatAmount(out.nValue) << "\n";

        bytevector wp;
        int wver;
        if(out.scriptPubKey.IsWitnessProgram(wver, wp))
        {
            if(wver == 0 && wp.size() == 20) std::clog << "\t\tPubKeyHash Witness program: "  << HexStr(wp) << "\n";
            else if (wver == 0 && wp.size() == 32) std::clog << "\t\tScriptHash Witness program: " << HexStr(wp) << "\n";
            else std::clog << "\t\tWitness program v" << wver << ": " << HexStr(wp) << "\n";
        } else
        {
            std::clog << "\t\tScriptPubKey: "<< HexStr(out.scriptPubKey) << "\n";
        }

    }
    std::clog << "\t}\n}" << std::endl;
}

template void LogTx<CTransaction>(const CTransaction& );
template void LogTx<CMutableTransaction>(const CMutableTransaction& );


}
