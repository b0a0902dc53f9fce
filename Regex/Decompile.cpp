
#include "Decompile.h"
#include "Ast.h"
#include "Constants.h"
#include "Program.h"

#include <QStringList>

namespace {

std::u16string ClassText(const CharSet &set) {
	std::u16string text = u"[";
	if (set.negated()) {
		text += u'^';
	}

	for (const CharSet::Range &range : set.ranges()) {
		text += range.first;
		if (range.last != range.first) {
			text += u'-';
			text += range.last;
		}
	}

	text += u']';
	return text;
}

QString CountText(uint32_t count) {
	return count == InfiniteDistance ? QLatin1String("inf") : QString::number(count);
}

QString GreedText(uint32_t greed) {
	switch (static_cast<Greed>(greed)) {
	case Greed::Greedy:
		return QLatin1String("greedy");
	case Greed::Lazy:
		return QLatin1String("lazy");
	case Greed::Possessive:
		return QLatin1String("possessive");
	}

	return QString();
}

QString LookText(uint32_t kind) {
	if (kind == AtomicGroup) {
		return QLatin1String("atomic");
	}

	switch (static_cast<LookKind>(kind)) {
	case LookKind::Ahead:
		return QLatin1String("ahead");
	case LookKind::NegativeAhead:
		return QLatin1String("negative-ahead");
	case LookKind::Behind:
		return QLatin1String("behind");
	case LookKind::NegativeBehind:
		return QLatin1String("negative-behind");
	}

	return QString();
}

class InstructionFormatter : public boost::static_visitor<QString> {
public:
	QString operator()(const Instruction1 &i) const {
		return QStringLiteral("%1 %2").arg(i.address, 5).arg(QLatin1String(OpcodeName(i.opcode)));
	}

	QString operator()(const Instruction2 &i) const {
		return QStringLiteral("%1 %2 %3").arg(i.address, 5).arg(QLatin1String(OpcodeName(i.opcode)), QString::fromStdU16String(i.text));
	}

	QString operator()(const Instruction3 &i) const {
		if (i.opcode == Opcode::Split) {
			return QStringLiteral("%1 %2 %3, %4").arg(i.address, 5).arg(QLatin1String(OpcodeName(i.opcode))).arg(i.target1).arg(i.target2);
		}

		return QStringLiteral("%1 %2 %3").arg(i.address, 5).arg(QLatin1String(OpcodeName(i.opcode))).arg(i.target1);
	}

	QString operator()(const Instruction4 &i) const {
		return QStringLiteral("%1 %2 %3").arg(i.address, 5).arg(QLatin1String(OpcodeName(i.opcode))).arg(i.index);
	}

	QString operator()(const Instruction5 &i) const {
		switch (i.opcode) {
		case Opcode::RepeatChar:
			return QStringLiteral("%1 %2 {%3,%4} %5").arg(i.address, 5).arg(QLatin1String(OpcodeName(i.opcode)), CountText(i.min), CountText(i.max), GreedText(i.greed));
		case Opcode::RepeatLoop:
			return QStringLiteral("%1 %2 r%3 {%4,%5} exit %6 %7").arg(i.address, 5).arg(QLatin1String(OpcodeName(i.opcode))).arg(i.index).arg(CountText(i.min), CountText(i.max)).arg(i.target).arg(GreedText(i.greed));
		case Opcode::RepeatEnter:
			return QStringLiteral("%1 %2 r%3 reset %4..%5").arg(i.address, 5).arg(QLatin1String(OpcodeName(i.opcode))).arg(i.index).arg(i.min).arg(i.max);
		case Opcode::RepeatIncrement:
			return QStringLiteral("%1 %2 r%3 loop %4").arg(i.address, 5).arg(QLatin1String(OpcodeName(i.opcode))).arg(i.index).arg(i.target);
		case Opcode::LookStart:
			return QStringLiteral("%1 %2 %3 {%4,%5} next %6").arg(i.address, 5).arg(QLatin1String(OpcodeName(i.opcode)), LookText(i.index), CountText(i.min), CountText(i.max)).arg(i.target);
		default:
			return QStringLiteral("%1 %2").arg(i.address, 5).arg(QLatin1String(OpcodeName(i.opcode)));
		}
	}
};

}

const char *OpcodeName(Opcode op) noexcept {
	switch (op) {
	case Opcode::Match:
		return "MATCH";
	case Opcode::Char:
		return "CHAR";
	case Opcode::CharIC:
		return "CHAR_IC";
	case Opcode::Any:
		return "ANY";
	case Opcode::Class:
		return "CLASS";
	case Opcode::ClassIC:
		return "CLASS_IC";
	case Opcode::String:
		return "STRING";
	case Opcode::StringIC:
		return "STRING_IC";
	case Opcode::BeginBuf:
		return "BEGIN_BUF";
	case Opcode::EndBuf:
		return "END_BUF";
	case Opcode::SemiEndBuf:
		return "SEMI_END_BUF";
	case Opcode::BeginLine:
		return "BEGIN_LINE";
	case Opcode::EndLine:
		return "END_LINE";
	case Opcode::WordBoundary:
		return "WORD_BOUNDARY";
	case Opcode::NotWordBoundary:
		return "NOT_WORD_BOUNDARY";
	case Opcode::Split:
		return "SPLIT";
	case Opcode::Jump:
		return "JUMP";
	case Opcode::SaveStart:
		return "SAVE_START";
	case Opcode::SaveEnd:
		return "SAVE_END";
	case Opcode::SaveStartUndo:
		return "SAVE_START_UNDO";
	case Opcode::SaveEndUndo:
		return "SAVE_END_UNDO";
	case Opcode::BackRef:
		return "BACKREF";
	case Opcode::BackRefIC:
		return "BACKREF_IC";
	case Opcode::RepeatChar:
		return "REPEAT_CHAR";
	case Opcode::RepeatInit:
		return "REPEAT_INIT";
	case Opcode::RepeatLoop:
		return "REPEAT_LOOP";
	case Opcode::RepeatEnter:
		return "REPEAT_ENTER";
	case Opcode::RepeatIncrement:
		return "REPEAT_INCREMENT";
	case Opcode::LookStart:
		return "LOOK_START";
	case Opcode::LookEnd:
		return "LOOK_END";
	case Opcode::Fail:
		return "FAIL";
	}

	return "UNKNOWN";
}

/**
 * @brief Decodes a program into typed records, one per instruction.
 *
 * @param program The program.
 * @return The records in program order.
 */
std::vector<DecodedInstruction> DecompileProgram(const Program &program) {
	std::vector<DecodedInstruction> results;
	results.reserve(program.code.size());

	uint32_t address = 0;
	for (const Instruction &instr : program.code) {
		switch (instr.op) {
		case Opcode::Char:
		case Opcode::CharIC:
			results.emplace_back(Instruction2{address, instr.op, std::u16string(1, static_cast<char16_t>(instr.a))});
			break;

		case Opcode::String:
		case Opcode::StringIC:
			results.emplace_back(Instruction2{address, instr.op, program.strings[instr.a]});
			break;

		case Opcode::Class:
		case Opcode::ClassIC:
			results.emplace_back(Instruction2{address, instr.op, ClassText(program.classes[instr.a])});
			break;

		case Opcode::Split:
		case Opcode::Jump:
			results.emplace_back(Instruction3{address, instr.op, instr.a, instr.b});
			break;

		case Opcode::SaveStart:
		case Opcode::SaveEnd:
		case Opcode::SaveStartUndo:
		case Opcode::SaveEndUndo:
		case Opcode::BackRef:
		case Opcode::BackRefIC:
		case Opcode::RepeatInit:
			results.emplace_back(Instruction4{address, instr.op, instr.a});
			break;

		case Opcode::RepeatChar:
			results.emplace_back(Instruction5{address, instr.op, 0, instr.a, instr.b, 0, instr.c});
			break;

		case Opcode::RepeatLoop:
			results.emplace_back(Instruction5{address, instr.op, instr.a, instr.b, instr.c, instr.d, instr.e});
			break;

		case Opcode::RepeatEnter:
			results.emplace_back(Instruction5{address, instr.op, instr.a, instr.b, instr.c, 0, 0});
			break;

		case Opcode::RepeatIncrement:
			results.emplace_back(Instruction5{address, instr.op, instr.a, 0, 0, instr.b, 0});
			break;

		case Opcode::LookStart:
			results.emplace_back(Instruction5{address, instr.op, instr.a, instr.c, instr.d, instr.b, 0});
			break;

		default:
			results.emplace_back(Instruction1{address, instr.op});
			break;
		}

		++address;
	}

	return results;
}

/**
 * @brief Produces a listing of a program, one instruction per line.
 */
QString Disassemble(const Program &program) {
	QStringList lines;

	const InstructionFormatter formatter;
	for (const DecodedInstruction &instr : DecompileProgram(program)) {
		lines << boost::apply_visitor(formatter, instr);
	}

	return lines.join(QLatin1Char('\n'));
}
